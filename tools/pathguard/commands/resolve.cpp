/**
 * pathguard CLI - resolve command
 *
 * Resolve paths the way file readers expect: a broken symlink is reported
 * as not found, temporary paths pass when --allow-temp is set.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct ResolveOptions {
    std::vector<std::string> paths;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }
    auto scope = manager->symlink_scope();

    bool all_ok = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& path : resolve_opts.paths) {
        auto resolved = manager->resolve_path(path);
        if (resolved.isErr()) {
            all_ok = false;
            if (opts.json) {
                results.push_back({{"path", path}, {"ok", false}, {"error", resolved.error().to_json()}});
            } else {
                std::cerr << "Error: " << resolved.error().format() << std::endl;
            }
            continue;
        }

        std::string shown = manager->original_case(resolved.value());
        if (opts.json) {
            results.push_back({{"path", path}, {"ok", true}, {"resolved", shown}});
        } else {
            std::cout << path << " -> " << shown << std::endl;
        }
    }

    if (opts.json) {
        output_json({{"ok", all_ok}, {"results", results}});
    }
    return all_ok ? 0 : 1;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("paths", resolve_opts.paths, "Paths to resolve")->required();

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace pathguard::cli::commands
