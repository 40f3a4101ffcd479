#pragma once

#include "pathguard/export.hpp"

#include <string>
#include <string_view>

namespace pathguard {

// ============================================================================
// Path Styles
// ============================================================================

// Separator and root conventions used by the lexical path algebra.
// Posix:   '/' is the only separator, '/' is the only root.
// Windows: '/' and '\' are separators; roots are '\', 'C:\', 'C:' and
//          '\\server\share\'.
enum class PathStyle {
    Posix,
    Windows,
};

// Style of the platform this library was built for.
PATHGUARD_API PathStyle native_path_style();

// Preferred separator for a style ('/' or '\').
PATHGUARD_API char path_separator(PathStyle style);

PATHGUARD_API bool is_separator(char c, PathStyle style);

// True for rooted paths. Windows style treats drive-relative forms such as
// "C:foo" as absolute too, since they never resolve under a caller's base.
PATHGUARD_API bool is_absolute_path(std::string_view path, PathStyle style);

// Windows style only: a drive letter and colon not followed by a separator
// ("C:", "C:foo"). Such a path depends on that drive's current directory.
PATHGUARD_API bool is_drive_relative(std::string_view path, PathStyle style);

// ============================================================================
// Lexical Normalization
// ============================================================================

// Collapse "." segments, ".." segments and repeated separators purely on the
// string. No filesystem access, no symlink awareness.
// - ".." pops the preceding segment; at a root it is dropped, in a relative
//   path with nothing left to pop it is kept
// - an empty relative result becomes "."
// - no trailing separator is kept except on a bare root
// - output uses path_separator(style)
PATHGUARD_API std::string normalize_lexical(std::string_view path, PathStyle style);

// Concatenate with exactly one separator between base and rel.
PATHGUARD_API std::string join_path(std::string_view base, std::string_view rel, PathStyle style);

// ============================================================================
// String Helpers
// ============================================================================

// ASCII case-insensitive substring test. `lower_needle` must already be
// lowercase. Does not allocate.
PATHGUARD_API bool contains_ignore_case(std::string_view haystack, std::string_view lower_needle);

// True when s is empty or holds only whitespace: ASCII whitespace plus the
// UTF-8 encodings of the Unicode space separators, U+0085, U+2028, U+2029 and
// U+FEFF.
PATHGUARD_API bool is_blank(std::string_view s);

} // namespace pathguard
