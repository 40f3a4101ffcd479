#pragma once

#include "pathguard/export.hpp"

#include <string>

namespace pathguard {

// ============================================================================
// Confined Asset Writes
// ============================================================================

struct WriteResult {
    bool ok = false;
    std::string path;   // absolute destination when ok
    std::string error;
};

// Write content to base_dir/relative_path only if the path stays inside
// base_dir. Missing parent directories under the base are created. The write
// is atomic. A rejected path touches nothing on disk. A path resolving to
// base_dir itself is rejected. An empty base_dir throws std::invalid_argument.
PATHGUARD_API WriteResult write_confined_file(const std::string& base_dir,
                                              const std::string& relative_path,
                                              const std::string& content);

// Write a generated asset whose name must be a bare filename (icons, legal
// pages). The name passes the filename guard and then the containment check.
PATHGUARD_API WriteResult write_named_asset(const std::string& base_dir,
                                            const std::string& filename,
                                            const std::string& content);

} // namespace pathguard
