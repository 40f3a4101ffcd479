#include <doctest/doctest.h>
#include <pathguard/check_manifest.hpp>

#include <stdexcept>

using pathguard::CheckKind;
using pathguard::CheckManifest;
using pathguard::parse_check_manifest;
using pathguard::run_check_manifest;

TEST_CASE("parse a full check manifest") {
    auto r = parse_check_manifest(R"({
        "$schema": "pathguard.check.v1",
        "base": "/srv/assets",
        "filenames": ["favicon-32x32.png", "privacy.html"],
        "paths": ["icons/logo.png"]
    })", "/etc/pathguard/check.json");

    REQUIRE(r.ok);
    CHECK(r.error.empty());
    CHECK(r.manifest.base == "/srv/assets");
    REQUIRE(r.manifest.filenames.size() == 2);
    CHECK(r.manifest.filenames[1] == "privacy.html");
    REQUIRE(r.manifest.paths.size() == 1);
    CHECK(r.manifest.source_path == "/etc/pathguard/check.json");
}

TEST_CASE("every section is optional") {
    auto r = parse_check_manifest("{}");
    REQUIRE(r.ok);
    CHECK(r.manifest.base.empty());
    CHECK(r.manifest.filenames.empty());
    CHECK(r.manifest.paths.empty());
}

TEST_CASE("malformed manifests fail closed") {
    SUBCASE("not JSON") {
        auto r = parse_check_manifest("{ filenames: ");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("JSON parse error") == 0);
    }

    SUBCASE("not an object") {
        auto r = parse_check_manifest("[\"a.png\"]");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "JSON must be an object");
    }

    SUBCASE("base not a string") {
        auto r = parse_check_manifest(R"({"base": 42})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "base must be a string");
    }

    SUBCASE("blank base") {
        auto r = parse_check_manifest(R"({"base": "  "})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "base empty");
    }

    SUBCASE("filenames not an array") {
        auto r = parse_check_manifest(R"({"filenames": "a.png"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "filenames must be an array of strings");
    }

    SUBCASE("non-string path entry") {
        auto r = parse_check_manifest(R"({"paths": ["ok.png", null]})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "paths[1] must be a string");
    }
}

#ifndef _WIN32

TEST_CASE("run a manifest against its base") {
    CheckManifest manifest;
    manifest.base = "/srv/assets";
    manifest.filenames = {"favicon.png", "../evil.png"};
    manifest.paths = {"icons/logo.png", "../../etc/passwd", "/etc/passwd"};

    auto report = run_check_manifest(manifest, "/unused", "/");
    CHECK(report.base == "/srv/assets");
    REQUIRE(report.entries.size() == 5);
    CHECK_FALSE(report.all_ok());
    CHECK(report.failure_count() == 3);

    CHECK(report.entries[0].kind == CheckKind::Filename);
    CHECK(report.entries[0].ok);
    CHECK(report.entries[1].reason == "parent directory token");

    CHECK(report.entries[2].kind == CheckKind::Path);
    CHECK(report.entries[2].path == "/srv/assets/icons/logo.png");
    CHECK(report.entries[3].reason == "escapes base directory");
    CHECK(report.entries[4].reason == "absolute path not allowed");
}

TEST_CASE("relative manifest base is taken from the manifest directory") {
    auto parsed = parse_check_manifest(R"({"base": "public", "paths": ["icons/a.png"]})",
                                       "/work/site/pathguard.json");
    REQUIRE(parsed.ok);

    auto report = run_check_manifest(parsed.manifest, "/fallback", "/cwd");
    CHECK(report.base == "/work/site/public");
    REQUIRE(report.entries.size() == 1);
    CHECK(report.entries[0].path == "/work/site/public/icons/a.png");
}

TEST_CASE("fallback base is used when the manifest names none") {
    CheckManifest manifest;
    manifest.paths = {"docs/readme.md"};

    auto report = run_check_manifest(manifest, "/srv/assets", "/");
    CHECK(report.base == "/srv/assets");
    CHECK(report.all_ok());
    CHECK(report.entries[0].path == "/srv/assets/docs/readme.md");
}

#endif

TEST_CASE("empty fallback base with paths to check throws") {
    CheckManifest manifest;
    manifest.paths = {"x"};
    CHECK_THROWS_AS(run_check_manifest(manifest, "", "/"), std::invalid_argument);
}

TEST_CASE("empty manifest is all ok") {
    CheckManifest manifest;
    auto report = run_check_manifest(manifest, "/srv", "/");
    CHECK(report.all_ok());
    CHECK(report.failure_count() == 0);
}
