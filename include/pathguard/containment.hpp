#pragma once

#include "pathguard/export.hpp"
#include "pathguard/path_utils.hpp"

#include <string>
#include <string_view>

namespace pathguard {

enum class PathRejection {
    None,
    Empty,               // empty or whitespace-only relative path
    EncodedTraversal,    // %2e%2e, %2f or %5c before normalization
    ContainsNul,
    AbsoluteNotAllowed,  // normalized relative path is rooted
    EscapesBase,
};

struct ContainmentResult {
    bool ok;
    std::string path;  // resolved absolute path when ok
    PathRejection rejection;
};

// Decide whether relative_path stays inside base_dir, without touching the
// filesystem.
// - Scans for URL-encoded traversal before normalizing
// - Collapses "." and ".." segments lexically
// - Rejects a relative path that normalizes to an absolute one
// - Accepts only a resolved path equal to the resolved base or below it
//   (separator-aware, so "/app/public-evil" is not inside "/app/public")
//
// working_dir is used only to make a relative base_dir absolute and must
// itself be absolute in that case. Unsafe content is reported through the
// result; std::invalid_argument is thrown for an empty, blank or NUL-carrying
// base_dir, for a Windows drive-relative base_dir ("C:", "C:assets"), or for a
// relative base_dir without a usable working_dir. Those checks run before the
// relative path is looked at.
PATHGUARD_API ContainmentResult check_path(std::string_view base_dir,
                                           std::string_view relative_path,
                                           std::string_view working_dir,
                                           PathStyle style = native_path_style());

// Boolean form of check_path. The working directory is read only when
// base_dir is relative; if it cannot be read the path is rejected.
PATHGUARD_API bool is_path_safe_with_base(std::string_view base_dir, std::string_view relative_path);

// Null pointers throw std::invalid_argument.
PATHGUARD_API bool is_path_safe_with_base(const char* base_dir, const char* relative_path);

// Same check with the current working directory as the base. The directory is
// snapshotted once per call.
PATHGUARD_API bool is_path_safe_relative_to_cwd(std::string_view relative_path);

PATHGUARD_API bool is_path_safe_relative_to_cwd(const char* relative_path);

PATHGUARD_API const char* path_rejection_to_string(PathRejection rejection);

} // namespace pathguard
