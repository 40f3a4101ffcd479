/**
 * pathguard CLI - path command
 *
 * Check relative paths against a base directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <optional>
#include <stdexcept>

namespace pathguard::cli::commands {

namespace {

struct PathOptions {
    std::optional<std::string> base;  // set only when --base was given
    std::vector<std::string> paths;
};

int cmd_path(const GlobalOptions& opts, const PathOptions& path_opts) {
    configure_logging(opts);

    auto base = resolve_base_dir(path_opts.base);
    auto cwd = current_working_directory();
    if (!base || !cwd) {
        print_error("cannot determine the working directory", opts.json);
        return kExitInvalidInput;
    }

    CheckReport report;
    report.base = *base;
    try {
        for (const auto& path : path_opts.paths) {
            report.entries.push_back(check_path_entry(*base, path, *cwd));
        }
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return kExitInvalidInput;
    }
    return emit_report(report, opts);
}

} // anonymous namespace

void setup_path(CLI::App* app, GlobalOptions& opts) {
    static PathOptions path_opts;
    static std::string base_value;

    auto* base_opt = app->add_option("--base", base_value,
                                     "Base directory (default: $PATHGUARD_BASE, then the working directory)");
    app->add_option("paths", path_opts.paths, "Relative paths to check")->required();

    app->callback([&opts, base_opt]() {
        if (base_opt->count() > 0) {
            path_opts.base = base_value;
        }
        std::exit(cmd_path(opts, path_opts));
    });
}

} // namespace pathguard::cli::commands
