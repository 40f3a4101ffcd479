/**
 * pathguard CLI - check command
 *
 * Validate every filename and path declared in a check manifest.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <optional>
#include <stdexcept>

namespace pathguard::cli::commands {

namespace {

struct CheckOptions {
    std::string manifest_path;
    std::optional<std::string> base;  // set only when --base was given
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    configure_logging(opts);

    auto loaded = load_check_manifest(check_opts.manifest_path);
    if (!loaded.ok) {
        print_error(check_opts.manifest_path + ": " + loaded.error, opts.json);
        return kExitInvalidInput;
    }

    // Rejected even when the manifest names its own base.
    if (check_opts.base && is_blank(*check_opts.base)) {
        print_error("base_dir must be a non-empty string", opts.json);
        return kExitInvalidInput;
    }

    auto fallback_base = resolve_base_dir(check_opts.base);
    auto cwd = current_working_directory();
    if (!fallback_base || !cwd) {
        print_error("cannot determine the working directory", opts.json);
        return kExitInvalidInput;
    }

    spdlog::debug("checking {} filenames and {} paths from {}",
                  loaded.manifest.filenames.size(), loaded.manifest.paths.size(),
                  check_opts.manifest_path);

    try {
        auto report = run_check_manifest(loaded.manifest, *fallback_base, *cwd);
        return emit_report(report, opts);
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return kExitInvalidInput;
    }
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;
    static std::string base_value;

    app->add_option("manifest", check_opts.manifest_path, "Check manifest (JSON)")->required();
    auto* base_opt = app->add_option("--base", base_value,
                                     "Base used when the manifest names none (default: $PATHGUARD_BASE, then the working directory)");

    app->callback([&opts, base_opt]() {
        if (base_opt->count() > 0) {
            check_opts.base = base_value;
        }
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace pathguard::cli::commands
