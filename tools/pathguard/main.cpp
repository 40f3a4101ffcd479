/**
 * pathguard CLI - Entry Point
 *
 * Validates output filenames and relative paths for build and asset scripts
 * before they write to disk.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pathguard::cli::commands {
    void setup_filename(CLI::App* app, GlobalOptions& opts);
    void setup_path(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathguard::cli;

    CLI::App app{"pathguard - path traversal checks for build tooling"};
    app.set_version_flag("-V,--version", PATHGUARD_VERSION_STRING);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Only report failures");

    auto* filename_cmd = app.add_subcommand("filename", "Check bare filenames");
    commands::setup_filename(filename_cmd, opts);

    auto* path_cmd = app.add_subcommand("path", "Check relative paths against a base directory");
    commands::setup_path(path_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Check every entry of a manifest");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
