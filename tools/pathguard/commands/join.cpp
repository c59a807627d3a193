/**
 * pathguard CLI - join command
 *
 * Join untrusted segments onto a base directory without touching the
 * filesystem.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct JoinOptions {
    std::string base;
    std::vector<std::string> segments;
    bool windows = false;
};

int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts, get_env("PATHGUARD_LOG_LEVEL").value_or(""));

    const PathPolicy& policy = join_opts.windows ? windows_path_policy() : host_path_policy();
    auto joined = safe_join(join_opts.base, join_opts.segments, policy);

    if (!joined) {
        if (opts.json) {
            output_json({{"ok", false}, {"policy", policy.name()}, {"error", "join rejected"}});
        } else {
            std::cerr << "Error: join rejected" << std::endl;
        }
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"policy", policy.name()}, {"path", *joined}});
    } else {
        std::cout << *joined << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("base", join_opts.base, "Trusted base directory")->required();
    app->add_option("segments", join_opts.segments, "Untrusted segments");
    app->add_flag("--windows", join_opts.windows, "Apply Windows path rules");

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

} // namespace pathguard::cli::commands
