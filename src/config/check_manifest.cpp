#include "pathguard/check_manifest.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/filename_guard.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace pathguard {

namespace {

// Reads a string array, failing on the first non-string element.
bool get_string_array(const nlohmann::json& j, const std::string& key,
                      std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array of strings";
        return false;
    }
    for (size_t i = 0; i < j[key].size(); ++i) {
        const auto& elem = j[key][i];
        if (!elem.is_string()) {
            error = key + "[" + std::to_string(i) + "] must be a string";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

std::string effective_base(const CheckManifest& manifest, const std::string& fallback_base) {
    if (manifest.base.empty()) return fallback_base;

    const PathStyle style = native_path_style();
    if (is_absolute_path(manifest.base, style) || manifest.source_path.empty()) {
        return manifest.base;
    }
    std::string manifest_dir = get_parent_directory(manifest.source_path);
    if (manifest_dir.empty()) return manifest.base;
    return join_path(manifest_dir, manifest.base, style);
}

} // namespace

CheckManifestParseResult parse_check_manifest(const std::string& json_str,
                                              const std::string& source_path) {
    CheckManifestParseResult result;
    result.manifest.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema is ignored - it's for editor tooling only

        if (j.contains("base")) {
            if (!j["base"].is_string()) {
                result.error = "base must be a string";
                return result;
            }
            result.manifest.base = j["base"].get<std::string>();
            if (is_blank(result.manifest.base)) {
                result.error = "base empty";
                return result;
            }
        }

        if (!get_string_array(j, "filenames", result.manifest.filenames, result.error) ||
            !get_string_array(j, "paths", result.manifest.paths, result.error)) {
            return result;
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

CheckManifestParseResult load_check_manifest(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        CheckManifestParseResult result;
        result.manifest.source_path = file_path;
        result.error = "cannot read " + file_path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_check_manifest(buffer.str(), file_path);
}

bool CheckReport::all_ok() const {
    return failure_count() == 0;
}

size_t CheckReport::failure_count() const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [](const CheckEntry& e) { return !e.ok; }));
}

CheckEntry check_filename_entry(const std::string& name) {
    CheckEntry entry;
    entry.kind = CheckKind::Filename;
    entry.input = name;

    auto verdict = check_filename(name);
    entry.ok = verdict.ok;
    if (!verdict.ok) {
        entry.reason = filename_issue_to_string(verdict.issue);
    }
    return entry;
}

CheckEntry check_path_entry(const std::string& base_dir,
                            const std::string& relative_path,
                            const std::string& working_dir) {
    CheckEntry entry;
    entry.kind = CheckKind::Path;
    entry.input = relative_path;

    auto checked = check_path(base_dir, relative_path, working_dir);
    entry.ok = checked.ok;
    if (checked.ok) {
        entry.path = checked.path;
    } else {
        entry.reason = path_rejection_to_string(checked.rejection);
    }
    return entry;
}

CheckReport run_check_manifest(const CheckManifest& manifest,
                               const std::string& fallback_base,
                               const std::string& working_dir) {
    CheckReport report;
    report.base = effective_base(manifest, fallback_base);

    for (const auto& name : manifest.filenames) {
        report.entries.push_back(check_filename_entry(name));
    }
    for (const auto& path : manifest.paths) {
        report.entries.push_back(check_path_entry(report.base, path, working_dir));
    }
    return report;
}

const char* check_kind_to_string(CheckKind kind) {
    switch (kind) {
        case CheckKind::Filename: return "filename";
        case CheckKind::Path: return "path";
    }
    return "unknown";
}

} // namespace pathguard
