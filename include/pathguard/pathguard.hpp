#pragma once

/**
 * pathguard - string-level path confinement checks.
 *
 * Two independent checkers:
 *   - check_filename / is_filename_safe for bare output filenames
 *   - check_path / is_path_safe_with_base / is_path_safe_relative_to_cwd for
 *     relative paths that must stay under a base directory
 *
 * A false verdict is a hard stop: callers refuse the operation rather than
 * trying to repair the input.
 */

#define PATHGUARD_VERSION_MAJOR 1
#define PATHGUARD_VERSION_MINOR 0
#define PATHGUARD_VERSION_PATCH 0
#define PATHGUARD_VERSION_STRING "1.0.0"

#include "pathguard/asset_writer.hpp"
#include "pathguard/check_manifest.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/filename_guard.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"
