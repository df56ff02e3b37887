#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace lode {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Replace `path` atomically (staging file + fsync + rename). Missing parent
// directories are created; descriptors, caches and configs are written this way.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Write content to `path` and set its permission bits to `mode`.
// Parent directories must exist.
AtomicWriteResult write_file_with_mode(const std::string& path,
                                       const std::vector<uint8_t>& content,
                                       uint32_t mode);
AtomicWriteResult write_file_with_mode(const std::string& path,
                                       const std::string& content,
                                       uint32_t mode);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Make a path absolute against the current working directory
std::string absolute_path(const std::string& path);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// Check whether the current process may create files in a directory
bool is_writable(const std::string& path);

// List directory entries (file names only)
std::vector<std::string> list_directory(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// Read a whole file
std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path);
std::optional<std::string> read_text_file(const std::string& path);

// Permission bits of a file (e.g. 0644), or nullopt if it cannot be stat'ed
std::optional<uint32_t> get_file_mode(const std::string& path);

// ============================================================================
// Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase hex
};

HashResult compute_sha256(const std::vector<uint8_t>& data);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace lode
