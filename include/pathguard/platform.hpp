#pragma once

#include "pathguard/export.hpp"

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
PATHGUARD_API AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Filesystem Helpers
// ============================================================================

// Convert a path to use forward slashes (portable format, used in reports)
PATHGUARD_API std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
PATHGUARD_API std::string get_parent_directory(const std::string& path);

// Create directories recursively. Empty error string on success.
PATHGUARD_API std::string create_directories(const std::string& path);

PATHGUARD_API bool is_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Snapshot of the process working directory, nullopt if it cannot be read
PATHGUARD_API std::optional<std::string> current_working_directory();

// Get an environment variable
PATHGUARD_API std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
PATHGUARD_API std::string generate_uuid();

} // namespace pathguard
