/**
 * pathguard CLI - normalize command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct NormalizeOptions {
    std::string path;
    bool windows_check = false;
};

int cmd_normalize(const GlobalOptions& opts, const NormalizeOptions& normalize_opts) {
    init_warning_collector(opts.json, opts.quiet);
    configure_logging(opts, get_env("PATHGUARD_LOG_LEVEL").value_or(""));

    if (normalize_opts.windows_check) {
        if (auto problem = validate_windows_path(normalize_opts.path)) {
            print_error(*problem, opts.json);
            return 1;
        }
    }

    auto normalized = normalize(normalize_opts.path);
    if (normalized.isErr()) {
        print_security_error(normalized.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"path", normalize_opts.path}, {"normalized", normalized.value().str()}});
    } else {
        std::cout << normalized.value().str() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_normalize(CLI::App* app, GlobalOptions& opts) {
    static NormalizeOptions normalize_opts;

    app->add_option("path", normalize_opts.path, "Path to normalize")->required();
    app->add_flag("--windows-check", normalize_opts.windows_check,
                  "Also apply the Windows path validator");

    app->callback([&opts]() {
        std::exit(cmd_normalize(opts, normalize_opts));
    });
}

} // namespace pathguard::cli::commands
