#include "lode/path_utils.hpp"
#include "lode/platform.hpp"

#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace lode {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool looks_absolute(const std::string& s) {
    if (!s.empty() && (s[0] == '/' || s[0] == '\\')) return true;
    // C:\ or C:/
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

// Split on either separator so Windows-style entries are checked too
std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == '/' || c == '\\') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "ok";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes package directory";
        default: return "invalid path";
    }
}

PathResult normalize_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (looks_absolute(relative_path)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_components(relative_path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    std::filesystem::path p(root);
    for (const auto& c : normalized) {
        p /= c;
    }
    return {true, to_portable_path(p.lexically_normal().string()), PathError::None};
}

bool is_safe_relative_path(const std::string& relative_path) {
    return normalize_under_root("root", relative_path).ok;
}

} // namespace lode
