/**
 * pathguard CLI - allowed command
 *
 * Report whether each path lies inside the trust boundary. Existence is not
 * checked.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct AllowedOptions {
    std::vector<std::string> paths;
};

int cmd_allowed(const GlobalOptions& opts, const AllowedOptions& allowed_opts) {
    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    bool all_allowed = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& path : allowed_opts.paths) {
        bool allowed = manager->is_path_allowed(path);
        all_allowed = all_allowed && allowed;
        if (opts.json) {
            results.push_back({{"path", path}, {"allowed", allowed}});
        } else {
            std::cout << (allowed ? "allowed " : "denied  ") << path << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_allowed;
        j["base_dir"] = manager->base_dir();
        j["allowed_dirs"] = manager->allowed_dirs();
        j["results"] = results;
        output_json(j);
    }
    return all_allowed ? 0 : 1;
}

} // anonymous namespace

void setup_allowed(CLI::App* app, GlobalOptions& opts) {
    static AllowedOptions allowed_opts;

    app->add_option("paths", allowed_opts.paths, "Paths to test")->required();

    app->callback([&opts]() {
        std::exit(cmd_allowed(opts, allowed_opts));
    });
}

} // namespace pathguard::cli::commands
