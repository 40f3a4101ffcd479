#include <doctest/doctest.h>
#include <pathguard/check_manifest.hpp>
#include <pathguard/containment.hpp>
#include <pathguard/platform.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

// Creates <tmp>/pathguard_cwd_<uuid>/srv/assets and makes it the working
// directory for the lifetime of the object.
class ScopedAssetsCwd {
public:
    ScopedAssetsCwd() {
        previous_ = fs::current_path();
        root_ = fs::temp_directory_path() / ("pathguard_cwd_" + pathguard::generate_uuid());
        assets_ = root_ / "srv" / "assets";
        fs::create_directories(assets_);
        fs::current_path(assets_);
    }

    ~ScopedAssetsCwd() {
        std::error_code ec;
        fs::current_path(previous_, ec);
        fs::remove_all(root_, ec);
    }

    const fs::path& assets() const { return assets_; }
    const fs::path& root() const { return root_; }

private:
    fs::path previous_;
    fs::path root_;
    fs::path assets_;
};

} // namespace

TEST_CASE("relative_to_cwd uses the working directory as the base") {
    ScopedAssetsCwd cwd;

    CHECK(pathguard::is_path_safe_relative_to_cwd("docs/readme.md"));
    CHECK(pathguard::is_path_safe_relative_to_cwd("."));
    CHECK_FALSE(pathguard::is_path_safe_relative_to_cwd("../secret"));
    CHECK_FALSE(pathguard::is_path_safe_relative_to_cwd("docs/../../x"));
    CHECK_FALSE(pathguard::is_path_safe_relative_to_cwd("/etc/passwd"));
}

TEST_CASE("relative base directory is anchored at the working directory") {
    ScopedAssetsCwd cwd;

    CHECK(pathguard::is_path_safe_with_base("icons", "logo.png"));
    CHECK_FALSE(pathguard::is_path_safe_with_base("icons", "../logo.png"));
    CHECK(pathguard::is_path_safe_with_base("..", "assets/logo.png"));
    CHECK_FALSE(pathguard::is_path_safe_with_base("..", "../x"));
}

TEST_CASE("check manifest loaded from disk") {
    ScopedAssetsCwd cwd;

    auto manifest_path = (cwd.assets() / "pathguard.json").string();
    std::ofstream(manifest_path) << R"({
  "base": "public",
  "filenames": ["favicon.ico", "%2E%2E"],
  "paths": ["legal/terms.md", "../../private.key"]
})";

    auto loaded = pathguard::load_check_manifest(manifest_path);
    REQUIRE(loaded.ok);

    auto report = pathguard::run_check_manifest(loaded.manifest, cwd.assets().string(),
                                                cwd.assets().string());
    REQUIRE(report.entries.size() == 4);
    CHECK(report.entries[0].ok);
    CHECK_FALSE(report.entries[1].ok);
    CHECK(report.entries[2].ok);
    CHECK(fs::path(report.entries[2].path) == cwd.assets() / "public" / "legal" / "terms.md");
    CHECK_FALSE(report.entries[3].ok);
    CHECK(report.failure_count() == 2);
}

TEST_CASE("missing manifest file is an error") {
    ScopedAssetsCwd cwd;

    auto loaded = pathguard::load_check_manifest((cwd.root() / "missing.json").string());
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.error.find("cannot read") == 0);
}
