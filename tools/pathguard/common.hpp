/**
 * pathguard CLI - Common utilities and types
 */

#pragma once

#include <pathguard/pathguard.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace pathguard::cli {

// Process exit codes shared by all commands.
constexpr int kExitSafe = 0;
constexpr int kExitUnsafe = 1;
constexpr int kExitInvalidInput = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void configure_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Resolve the base directory for path checks.
 * Priority: --base flag > PATHGUARD_BASE env > current working directory
 *
 * A --base that was given is returned as-is, even when empty, so the
 * resolver rejects it instead of this falling through to another directory.
 */
inline std::optional<std::string> resolve_base_dir(const std::optional<std::string>& override_base) {
    if (override_base) {
        return override_base;
    }

    auto env_base = get_env("PATHGUARD_BASE");
    if (env_base && !env_base->empty()) {
        return env_base;
    }

    return current_working_directory();
}

// Inputs may carry invalid UTF-8, which a plain dump() throws on.
inline std::string dump_json(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << dump_json(j, 2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline nlohmann::json entry_to_json(const CheckEntry& entry) {
    nlohmann::json j;
    j["kind"] = check_kind_to_string(entry.kind);
    j["input"] = entry.input;
    j["ok"] = entry.ok;
    if (!entry.ok) {
        j["reason"] = entry.reason;
    }
    if (!entry.path.empty()) {
        j["path"] = to_portable_path(entry.path);
    }
    return j;
}

/**
 * Print a report and map it to an exit code.
 * Text mode prints one line per entry; quiet mode prints only failures.
 */
inline int emit_report(const CheckReport& report, const GlobalOptions& opts) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.all_ok();
        if (!report.base.empty()) {
            j["base"] = to_portable_path(report.base);
        }
        j["results"] = nlohmann::json::array();
        for (const auto& entry : report.entries) {
            j["results"].push_back(entry_to_json(entry));
        }
        std::cout << dump_json(j, 2) << std::endl;
    } else {
        for (const auto& entry : report.entries) {
            if (entry.ok) {
                if (!opts.quiet) {
                    std::cout << "ok      " << check_kind_to_string(entry.kind) << " "
                              << dump_json(entry.input) << std::endl;
                }
            } else {
                std::cout << "unsafe  " << check_kind_to_string(entry.kind) << " "
                          << dump_json(entry.input) << ": " << entry.reason << std::endl;
            }
        }
        if (!opts.quiet && !report.all_ok()) {
            std::cout << report.failure_count() << " of " << report.entries.size()
                      << " entries unsafe" << std::endl;
        }
    }

    return report.all_ok() ? kExitSafe : kExitUnsafe;
}

} // namespace pathguard::cli
