/**
 * pathguard CLI - Entry Point
 *
 * Decides whether user-supplied paths may be read.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pathguard::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_allowed(CLI::App* app, GlobalOptions& opts);
    void setup_join(CLI::App* app, GlobalOptions& opts);
    void setup_normalize(CLI::App* app, GlobalOptions& opts);
    void setup_collect(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathguard::cli;

    CLI::App app{"pathguard - path access checks for local files"};
    app.set_version_flag("-V,--version", PATHGUARD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "JSON config file (pathguard.config.v1)");
    app.add_option("--base-dir", opts.base_dir, "Base directory (default: current directory)");
    app.add_option("--allowed-dir", opts.allowed_dirs, "Additional allowed directory (repeatable)");
    app.add_option("--allowed-dirs-file", opts.allowed_dirs_file,
                   "File listing allowed directories, one per line");
    app.add_option("--allow-file", opts.allow_files, "Allow one file by identity (repeatable)");
    app.add_option("--allow-list", opts.allow_lists, "Allow-list of files and directories (repeatable)");
    app.add_flag("--allow-temp", opts.allow_temp, "Allow paths in the temporary directory");
    app.add_option("--mode", opts.mode, "Security mode: permissive, warn or strict");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* check_cmd = app.add_subcommand("check", "Validate paths for reading");
    commands::setup_check(check_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve paths (broken links report not found)");
    commands::setup_resolve(resolve_cmd, opts);

    auto* allowed_cmd = app.add_subcommand("allowed", "Test paths against the allowed directories");
    commands::setup_allowed(allowed_cmd, opts);

    auto* join_cmd = app.add_subcommand("join", "Join untrusted segments onto a base");
    commands::setup_join(join_cmd, opts);

    auto* normalize_cmd = app.add_subcommand("normalize", "Print the normalized form of a path");
    commands::setup_normalize(normalize_cmd, opts);

    auto* collect_cmd = app.add_subcommand("collect", "List validated files of a directory or list file");
    commands::setup_collect(collect_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
