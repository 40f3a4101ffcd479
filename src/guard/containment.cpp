#include "pathguard/containment.hpp"
#include "pathguard/platform.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace pathguard {

namespace {

// Checked before normalization, which only understands literal '.', '..'
// and separators and would pass the encoded forms through untouched.
constexpr std::string_view kEncodedTraversal[] = {
    "%2e%2e",
    "%2e%2e%2f",
    "%2f",
    "%5c",
};

bool contains_nul(std::string_view s) {
    return s.find('\0') != std::string_view::npos;
}

bool has_encoded_traversal(std::string_view s) {
    for (auto needle : kEncodedTraversal) {
        if (contains_ignore_case(s, needle)) return true;
    }
    return false;
}

void validate_base_dir(std::string_view base_dir) {
    if (is_blank(base_dir) || contains_nul(base_dir)) {
        throw std::invalid_argument("base_dir must be a non-empty string");
    }
}

ContainmentResult reject(std::string_view relative_path, PathRejection rejection) {
    spdlog::debug("path rejected ({}): {}", path_rejection_to_string(rejection), relative_path);
    return {false, {}, rejection};
}

bool is_inside(const std::string& resolved_path, const std::string& resolved_base, PathStyle style) {
    if (resolved_path == resolved_base) return true;
    if (resolved_path.size() <= resolved_base.size()) return false;
    if (resolved_path.compare(0, resolved_base.size(), resolved_base) != 0) return false;
    // A bare root already ends with its separator.
    if (is_separator(resolved_base.back(), style)) return true;
    return resolved_path[resolved_base.size()] == path_separator(style);
}

std::string resolve_base(std::string_view base_dir, std::string_view working_dir, PathStyle style) {
    if (is_drive_relative(base_dir, style)) {
        throw std::invalid_argument("base_dir must not be drive-relative");
    }
    if (is_absolute_path(base_dir, style)) {
        return normalize_lexical(base_dir, style);
    }
    if (!is_absolute_path(working_dir, style) || is_drive_relative(working_dir, style)) {
        throw std::invalid_argument("working_dir must be an absolute path");
    }
    return normalize_lexical(join_path(working_dir, base_dir, style), style);
}

} // namespace

ContainmentResult check_path(std::string_view base_dir,
                             std::string_view relative_path,
                             std::string_view working_dir,
                             PathStyle style) {
    validate_base_dir(base_dir);
    const std::string resolved_base = resolve_base(base_dir, working_dir, style);

    if (is_blank(relative_path)) {
        return reject(relative_path, PathRejection::Empty);
    }
    if (contains_nul(relative_path)) {
        return reject(relative_path, PathRejection::ContainsNul);
    }
    if (has_encoded_traversal(relative_path)) {
        return reject(relative_path, PathRejection::EncodedTraversal);
    }

    std::string normalized = normalize_lexical(relative_path, style);
    if (is_absolute_path(normalized, style)) {
        return reject(relative_path, PathRejection::AbsoluteNotAllowed);
    }

    std::string resolved_path = normalize_lexical(join_path(resolved_base, normalized, style), style);

    if (!is_inside(resolved_path, resolved_base, style)) {
        return reject(relative_path, PathRejection::EscapesBase);
    }
    return {true, resolved_path, PathRejection::None};
}

bool is_path_safe_with_base(std::string_view base_dir, std::string_view relative_path) {
    const PathStyle style = native_path_style();
    validate_base_dir(base_dir);

    std::string working_dir;
    if (!is_absolute_path(base_dir, style)) {
        auto cwd = current_working_directory();
        if (!cwd) {
            spdlog::warn("working directory unavailable, rejecting path: {}", relative_path);
            return false;
        }
        working_dir = *cwd;
    }
    return check_path(base_dir, relative_path, working_dir, style).ok;
}

bool is_path_safe_with_base(const char* base_dir, const char* relative_path) {
    if (base_dir == nullptr) {
        throw std::invalid_argument("base_dir must be a non-empty string");
    }
    if (relative_path == nullptr) {
        throw std::invalid_argument("relative_path must be a string");
    }
    return is_path_safe_with_base(std::string_view(base_dir), std::string_view(relative_path));
}

bool is_path_safe_relative_to_cwd(std::string_view relative_path) {
    auto cwd = current_working_directory();
    if (!cwd) {
        spdlog::warn("working directory unavailable, rejecting path: {}", relative_path);
        return false;
    }
    return check_path(*cwd, relative_path, *cwd).ok;
}

bool is_path_safe_relative_to_cwd(const char* relative_path) {
    if (relative_path == nullptr) {
        throw std::invalid_argument("relative_path must be a string");
    }
    return is_path_safe_relative_to_cwd(std::string_view(relative_path));
}

const char* path_rejection_to_string(PathRejection rejection) {
    switch (rejection) {
        case PathRejection::None: return "none";
        case PathRejection::Empty: return "empty path";
        case PathRejection::EncodedTraversal: return "encoded traversal sequence";
        case PathRejection::ContainsNul: return "null byte";
        case PathRejection::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathRejection::EscapesBase: return "escapes base directory";
    }
    return "unknown";
}

} // namespace pathguard
