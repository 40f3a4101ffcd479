#include "pathguard/filename_guard.hpp"
#include "pathguard/path_utils.hpp"

namespace pathguard {

namespace {

struct UnsafePattern {
    std::string_view needle;  // lowercase
    FilenameIssue issue;
};

constexpr UnsafePattern kUnsafePatterns[] = {
    {"..", FilenameIssue::ParentToken},
    {"/", FilenameIssue::Separator},
    {"\\", FilenameIssue::Separator},
    {"%2e%2e", FilenameIssue::EncodedParent},
    {"%2f", FilenameIssue::EncodedSeparator},
    {"%5c", FilenameIssue::EncodedSeparator},
    {std::string_view("\0", 1), FilenameIssue::NulByte},
    {"%00", FilenameIssue::NulByte},
};

} // namespace

FilenameVerdict check_filename(std::string_view name) {
    FilenameVerdict verdict;
    if (is_blank(name)) {
        verdict.issue = FilenameIssue::Empty;
        return verdict;
    }

    for (const auto& pattern : kUnsafePatterns) {
        if (contains_ignore_case(name, pattern.needle)) {
            verdict.issue = pattern.issue;
            return verdict;
        }
    }

    verdict.ok = true;
    return verdict;
}

bool is_filename_safe(std::string_view name) {
    return check_filename(name).ok;
}

bool is_filename_safe(const char* name) {
    if (name == nullptr) return false;
    return is_filename_safe(std::string_view(name));
}

const char* filename_issue_to_string(FilenameIssue issue) {
    switch (issue) {
        case FilenameIssue::None: return "none";
        case FilenameIssue::Empty: return "empty filename";
        case FilenameIssue::ParentToken: return "parent directory token";
        case FilenameIssue::Separator: return "directory separator";
        case FilenameIssue::EncodedParent: return "encoded parent directory token";
        case FilenameIssue::EncodedSeparator: return "encoded directory separator";
        case FilenameIssue::NulByte: return "null byte";
    }
    return "unknown";
}

} // namespace pathguard
