#pragma once

#include <string>

namespace lode {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Resolve an archive-relative path under a root directory, string-based.
// - Rejects empty paths and NUL bytes
// - Rejects absolute paths (leading separator or drive letter)
// - Collapses "." segments; ".." may not climb above root
PathResult normalize_under_root(const std::string& root, const std::string& relative_path);

// True when `relative_path` would stay inside any root
bool is_safe_relative_path(const std::string& relative_path);

} // namespace lode
