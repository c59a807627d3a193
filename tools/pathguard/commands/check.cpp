/**
 * pathguard CLI - check command
 *
 * Validate each path for reading.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct CheckOptions {
    std::vector<std::string> paths;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    bool all_ok = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& path : check_opts.paths) {
        auto scope = manager->symlink_scope();
        auto checked = manager->validate_path(path);
        if (checked.isOk()) {
            if (opts.json) {
                results.push_back({{"path", path}, {"ok", true}, {"resolved", checked.value()}});
            } else {
                print_success(checked.value(), false);
            }
        } else {
            all_ok = false;
            if (opts.json) {
                results.push_back({{"path", path}, {"ok", false}, {"error", checked.error().to_json()}});
            } else {
                std::cerr << "Error: " << checked.error().format() << std::endl;
            }
        }
    }

    if (opts.json) {
        output_json({{"ok", all_ok}, {"results", results}});
    }
    return all_ok ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("paths", check_opts.paths, "Paths to validate")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace pathguard::cli::commands
