/**
 * pathguard CLI - filename command
 *
 * Check bare output filenames (no directory component allowed).
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct FilenameOptions {
    std::vector<std::string> names;
};

int cmd_filename(const GlobalOptions& opts, const FilenameOptions& filename_opts) {
    configure_logging(opts);

    CheckReport report;
    for (const auto& name : filename_opts.names) {
        report.entries.push_back(check_filename_entry(name));
    }
    return emit_report(report, opts);
}

} // anonymous namespace

void setup_filename(CLI::App* app, GlobalOptions& opts) {
    static FilenameOptions filename_opts;

    app->add_option("names", filename_opts.names, "Filenames to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_filename(opts, filename_opts));
    });
}

} // namespace pathguard::cli::commands
