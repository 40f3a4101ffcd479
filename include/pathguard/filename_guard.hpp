#pragma once

#include "pathguard/export.hpp"

#include <string_view>

namespace pathguard {

// ============================================================================
// Filename Guard
// ============================================================================

// First rule a rejected filename tripped.
enum class FilenameIssue {
    None,
    Empty,             // empty or whitespace only
    ParentToken,       // ".."
    Separator,         // '/' or '\'
    EncodedParent,     // "%2e%2e", any case
    EncodedSeparator,  // "%2f" or "%5c", any case
    NulByte,           // raw NUL or "%00"
};

struct FilenameVerdict {
    bool ok = false;
    FilenameIssue issue = FilenameIssue::None;
};

// Check a bare filename, one with no directory component at all.
// Matching is plain substring containment on the ASCII-lowercased input;
// nothing is decoded. Never throws.
PATHGUARD_API FilenameVerdict check_filename(std::string_view name);

PATHGUARD_API bool is_filename_safe(std::string_view name);

// A null pointer is rejected rather than coerced. A C string ends at its
// first NUL, so names carrying arbitrary bytes must come in as string_view.
PATHGUARD_API bool is_filename_safe(const char* name);

PATHGUARD_API const char* filename_issue_to_string(FilenameIssue issue);

} // namespace pathguard
