#include "pathguard/path_utils.hpp"

#include <cctype>
#include <vector>

namespace pathguard {

namespace {

struct RootPrefix {
    std::string root;    // canonical spelling, with separators in style form
    size_t length = 0;   // characters of the input consumed by the root
    bool anchored = false;  // ".." cannot climb above it
};

bool is_drive_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

size_t skip_non_separators(std::string_view path, size_t pos, PathStyle style) {
    while (pos < path.size() && !is_separator(path[pos], style)) ++pos;
    return pos;
}

size_t skip_separators(std::string_view path, size_t pos, PathStyle style) {
    while (pos < path.size() && is_separator(path[pos], style)) ++pos;
    return pos;
}

RootPrefix parse_root(std::string_view path, PathStyle style) {
    RootPrefix prefix;
    if (path.empty()) return prefix;

    if (style == PathStyle::Posix) {
        if (path[0] == '/') {
            prefix.root = "/";
            prefix.length = 1;
            prefix.anchored = true;
        }
        return prefix;
    }

    // UNC: \\server\share
    if (path.size() >= 2 && is_separator(path[0], style) && is_separator(path[1], style)) {
        size_t server_end = skip_non_separators(path, 2, style);
        if (server_end == 2) {
            prefix.root = "\\";
            prefix.length = 1;
            prefix.anchored = true;
            return prefix;
        }
        prefix.root = "\\\\";
        prefix.root.append(path.substr(2, server_end - 2));
        prefix.root.push_back('\\');
        size_t share_begin = skip_separators(path, server_end, style);
        size_t share_end = skip_non_separators(path, share_begin, style);
        if (share_end > share_begin) {
            prefix.root.append(path.substr(share_begin, share_end - share_begin));
            prefix.root.push_back('\\');
            prefix.length = share_end;
        } else {
            prefix.length = server_end;
        }
        prefix.anchored = true;
        return prefix;
    }

    if (is_separator(path[0], style)) {
        prefix.root = "\\";
        prefix.length = 1;
        prefix.anchored = true;
        return prefix;
    }

    if (path.size() >= 2 && is_drive_letter(path[0]) && path[1] == ':') {
        prefix.root = std::string(path.substr(0, 2));
        prefix.length = 2;
        if (path.size() >= 3 && is_separator(path[2], style)) {
            prefix.root.push_back('\\');
            prefix.length = 3;
            prefix.anchored = true;
        }
    }
    return prefix;
}

// Length of the UTF-8 whitespace sequence starting at pos, or 0.
size_t unicode_space_length(std::string_view s, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[pos + i]); };
    const size_t left = s.size() - pos;

    if (left >= 2 && byte(0) == 0xC2 && (byte(1) == 0x85 || byte(1) == 0xA0)) {
        return 2;  // U+0085, U+00A0
    }
    if (left < 3) return 0;
    const unsigned char b0 = byte(0), b1 = byte(1), b2 = byte(2);
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) return 3;                 // U+1680
    if (b0 == 0xE2 && b1 == 0x80 && b2 >= 0x80 && b2 <= 0x8A) return 3;  // U+2000..U+200A
    if (b0 == 0xE2 && b1 == 0x80 && (b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;  // U+2028, U+2029, U+202F
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) return 3;  // U+205F
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) return 3;  // U+3000
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) return 3;  // U+FEFF
    return 0;
}

} // namespace

PathStyle native_path_style() {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

char path_separator(PathStyle style) {
    return style == PathStyle::Windows ? '\\' : '/';
}

bool is_separator(char c, PathStyle style) {
    if (c == '/') return true;
    return style == PathStyle::Windows && c == '\\';
}

bool is_absolute_path(std::string_view path, PathStyle style) {
    if (path.empty()) return false;
    if (is_separator(path[0], style)) return true;
    if (style == PathStyle::Windows && path.size() >= 2 &&
        is_drive_letter(path[0]) && path[1] == ':') {
        return true;
    }
    return false;
}

bool is_drive_relative(std::string_view path, PathStyle style) {
    if (style != PathStyle::Windows) return false;
    if (path.size() < 2 || !is_drive_letter(path[0]) || path[1] != ':') return false;
    return path.size() == 2 || !is_separator(path[2], style);
}

std::string normalize_lexical(std::string_view path, PathStyle style) {
    RootPrefix prefix = parse_root(path, style);

    std::vector<std::string_view> segments;
    size_t pos = prefix.length;
    while (pos < path.size()) {
        size_t end = skip_non_separators(path, pos, style);
        std::string_view segment = path.substr(pos, end - pos);
        pos = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!prefix.anchored) {
                segments.push_back(segment);
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string out = prefix.root;
    if (segments.empty()) {
        if (!prefix.anchored) out.push_back('.');
        return out;
    }

    const char sep = path_separator(style);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out.push_back(sep);
        out.append(segments[i]);
    }
    return out;
}

std::string join_path(std::string_view base, std::string_view rel, PathStyle style) {
    std::string out(base);
    if (rel.empty()) return out;
    if (!out.empty() && !is_separator(out.back(), style)) {
        out.push_back(path_separator(style));
    }
    out.append(rel);
    return out;
}

bool contains_ignore_case(std::string_view haystack, std::string_view lower_needle) {
    if (lower_needle.empty()) return true;
    if (lower_needle.size() > haystack.size()) return false;

    const size_t last = haystack.size() - lower_needle.size();
    for (size_t i = 0; i <= last; ++i) {
        size_t j = 0;
        while (j < lower_needle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
                   static_cast<unsigned char>(lower_needle[j])) {
            ++j;
        }
        if (j == lower_needle.size()) return true;
    }
    return false;
}

bool is_blank(std::string_view s) {
    size_t pos = 0;
    while (pos < s.size()) {
        if (std::isspace(static_cast<unsigned char>(s[pos]))) {
            ++pos;
            continue;
        }
        size_t len = unicode_space_length(s, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

} // namespace pathguard
