/**
 * pathguard CLI - collect command
 *
 * List the validated files of a directory and/or a list file.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <sstream>

namespace pathguard::cli::commands {

namespace {

struct CollectCliOptions {
    std::vector<std::string> dirs;
    std::vector<std::string> lists;
    bool recursive = false;
    std::string extensions;
};

std::vector<std::string> split_extensions(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

int cmd_collect(const GlobalOptions& opts, const CollectCliOptions& collect_opts) {
    if (collect_opts.dirs.empty() && collect_opts.lists.empty()) {
        init_warning_collector(opts.json, opts.quiet);
        print_error("Nothing to collect: pass --dir or --collect", opts.json);
        return 1;
    }

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    CollectOptions options;
    options.recursive = collect_opts.recursive;
    options.extensions = split_extensions(collect_opts.extensions);

    std::vector<std::string> files;
    for (const auto& dir : collect_opts.dirs) {
        auto collected = collect_files_from_directory(*manager, dir, options);
        if (collected.isErr()) {
            print_security_error(collected.error(), opts.json);
            return 1;
        }
        files.insert(files.end(), collected.value().begin(), collected.value().end());
    }
    for (const auto& list : collect_opts.lists) {
        // "@file" and "file" name the same list
        std::string list_file = (!list.empty() && list[0] == '@') ? list.substr(1) : list;
        auto collected = collect_files_from_list(*manager, list_file);
        if (collected.isErr()) {
            print_security_error(collected.error(), opts.json);
            return 1;
        }
        files.insert(files.end(), collected.value().begin(), collected.value().end());
    }

    if (opts.json) {
        output_json({{"ok", true}, {"files", files}});
    } else {
        for (const auto& f : files) {
            std::cout << f << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_collect(CLI::App* app, GlobalOptions& opts) {
    static CollectCliOptions collect_opts;

    app->add_option("--dir", collect_opts.dirs, "Directory to collect from (repeatable)");
    app->add_option("--collect", collect_opts.lists, "List file, optionally prefixed with '@' (repeatable)");
    app->add_flag("-r,--recursive", collect_opts.recursive, "Descend into subdirectories");
    app->add_option("--ext", collect_opts.extensions, "Comma-separated extensions to keep");

    app->callback([&opts]() {
        std::exit(cmd_collect(opts, collect_opts));
    });
}

} // namespace pathguard::cli::commands
