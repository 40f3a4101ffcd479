#include <doctest/doctest.h>
#include <pathguard/path_utils.hpp>

#include <string>

using pathguard::contains_ignore_case;
using pathguard::is_blank;

TEST_CASE("contains_ignore_case matches any case of the haystack") {
    CHECK(contains_ignore_case("%2E%2E", "%2e%2e"));
    CHECK(contains_ignore_case("x%2e%2Ey", "%2e%2e"));
    CHECK(contains_ignore_case("A%2Fb", "%2f"));
    CHECK_FALSE(contains_ignore_case("%2", "%2f"));
    CHECK_FALSE(contains_ignore_case("", "%2f"));
    CHECK(contains_ignore_case("anything", ""));
}

TEST_CASE("contains_ignore_case finds embedded NUL") {
    std::string with_nul("icon.png\0.exe", 13);
    CHECK(contains_ignore_case(with_nul, std::string_view("\0", 1)));
    CHECK_FALSE(contains_ignore_case("icon.png", std::string_view("\0", 1)));
}

TEST_CASE("is_blank") {
    CHECK(is_blank(""));
    CHECK(is_blank("   "));
    CHECK(is_blank(" \t\r\n"));
    CHECK_FALSE(is_blank(" a "));
}

TEST_CASE("is_blank treats unicode whitespace as blank") {
    CHECK(is_blank("\xC2\xA0"));                    // no-break space
    CHECK(is_blank(" \xE2\x80\xA8\t"));             // line separator
    CHECK(is_blank("\xEF\xBB\xBF"));                 // byte order mark
    CHECK(is_blank("\xE3\x80\x80\xE2\x80\x8A"));    // ideographic space, hair space
    CHECK(is_blank("\xC2\x85\xE1\x9A\x80\xE2\x81\x9F"));

    CHECK_FALSE(is_blank("\xC2\xA0" "a"));
    CHECK_FALSE(is_blank("\xE2\x80\x8B"));  // zero-width space is not whitespace
    CHECK_FALSE(is_blank("\xC2"));           // truncated sequence
    CHECK_FALSE(is_blank("\xE2\x80"));
}
