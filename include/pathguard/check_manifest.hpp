#pragma once

#include "pathguard/export.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Check Manifest
// ============================================================================

// Names and paths a build step is about to write, declared up front so they
// can be validated in one pass:
//
//   {
//     "base": "public",
//     "filenames": ["favicon-32x32.png"],
//     "paths": ["icons/logo.png"]
//   }
struct CheckManifest {
    std::string base;  // as written; relative values are taken from the manifest's directory
    std::vector<std::string> filenames;
    std::vector<std::string> paths;
    std::string source_path;
};

struct CheckManifestParseResult {
    bool ok = false;
    std::string error;
    CheckManifest manifest;
};

// Non-string entries in "filenames"/"paths" and a non-string "base" are
// errors rather than being skipped.
PATHGUARD_API CheckManifestParseResult parse_check_manifest(const std::string& json_str,
                                                            const std::string& source_path = "");

PATHGUARD_API CheckManifestParseResult load_check_manifest(const std::string& file_path);

// ============================================================================
// Check Report
// ============================================================================

enum class CheckKind {
    Filename,
    Path,
};

struct CheckEntry {
    CheckKind kind = CheckKind::Filename;
    std::string input;
    bool ok = false;
    std::string reason;  // empty when ok
    std::string path;    // resolved path for accepted Path entries
};

struct PATHGUARD_API CheckReport {
    std::string base;  // effective base the paths were checked against
    std::vector<CheckEntry> entries;

    bool all_ok() const;
    size_t failure_count() const;
};

PATHGUARD_API CheckEntry check_filename_entry(const std::string& name);

// Throws std::invalid_argument for an empty base_dir, like check_path.
PATHGUARD_API CheckEntry check_path_entry(const std::string& base_dir,
                                          const std::string& relative_path,
                                          const std::string& working_dir);

// fallback_base is used when the manifest names no base.
PATHGUARD_API CheckReport run_check_manifest(const CheckManifest& manifest,
                                             const std::string& fallback_base,
                                             const std::string& working_dir);

PATHGUARD_API const char* check_kind_to_string(CheckKind kind);

} // namespace pathguard
