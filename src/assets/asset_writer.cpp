#include "pathguard/asset_writer.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/filename_guard.hpp"
#include "pathguard/platform.hpp"

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

WriteResult rejected(const std::string& input, const std::string& reason) {
    spdlog::warn("refusing to write '{}': {}", input, reason);
    WriteResult result;
    result.error = reason;
    return result;
}

} // namespace

WriteResult write_confined_file(const std::string& base_dir,
                                const std::string& relative_path,
                                const std::string& content) {
    const PathStyle style = native_path_style();

    std::string working_dir;
    if (!is_absolute_path(base_dir, style)) {
        auto cwd = current_working_directory();
        if (!cwd) {
            return rejected(relative_path, "working directory unavailable");
        }
        working_dir = *cwd;
    }

    auto checked = check_path(base_dir, relative_path, working_dir, style);
    if (!checked.ok) {
        return rejected(relative_path, path_rejection_to_string(checked.rejection));
    }
    if (normalize_lexical(relative_path, style) == ".") {
        return rejected(relative_path, "path names the base directory itself");
    }

    WriteResult result;
    std::string parent = get_parent_directory(checked.path);
    if (!parent.empty() && !is_directory(parent)) {
        auto mkdir_error = create_directories(parent);
        if (!mkdir_error.empty()) {
            spdlog::error("failed to create {}: {}", parent, mkdir_error);
            result.error = "failed to create parent directory: " + mkdir_error;
            return result;
        }
    }

    auto written = atomic_write_file(checked.path, content);
    if (!written.ok) {
        spdlog::error("failed to write {}: {}", checked.path, written.error);
        result.error = written.error;
        return result;
    }

    spdlog::debug("wrote {} ({} bytes)", checked.path, content.size());
    result.ok = true;
    result.path = checked.path;
    return result;
}

WriteResult write_named_asset(const std::string& base_dir,
                              const std::string& filename,
                              const std::string& content) {
    auto verdict = check_filename(filename);
    if (!verdict.ok) {
        return rejected(filename, filename_issue_to_string(verdict.issue));
    }
    return write_confined_file(base_dir, filename, content);
}

} // namespace pathguard
