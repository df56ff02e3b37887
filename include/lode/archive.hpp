#pragma once

#include "lode/specification.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Package Archive (.lode)
// ============================================================================
//
// A gzip-compressed POSIX ustar archive holding:
//   metadata.json      the package specification
//   data/<path>        every package file, with its permission mode
//
// Archives are written deterministically: entries sorted, uid/gid 0,
// mtime 0, no owner names, gzip mtime 0 and OS 255.

constexpr const char* ARCHIVE_METADATA_ENTRY = "metadata.json";
constexpr const char* ARCHIVE_DATA_PREFIX = "data/";

struct FileEntry {
    std::string path;              // Package-relative, forward slashes
    uint32_t mode = 0644;          // Permission bits
    std::vector<uint8_t> content;
};

struct PackageArchive {
    Specification spec;
    std::vector<FileEntry> files;  // Archive order
    std::string source_path;       // Empty when built in memory
};

struct ArchiveReadResult {
    bool ok = false;
    std::string error;
    PackageArchive archive;
};

// Read and validate an archive. Rejects bad gzip, truncated or corrupt tar
// headers, missing or invalid metadata, links, and unsafe entry paths.
ArchiveReadResult read_package_archive(const std::string& path);
ArchiveReadResult read_package_archive(const std::vector<uint8_t>& data,
                                       const std::string& source_path = "");

struct ArchiveBuildResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

// Build a deterministic archive from a specification and its files
ArchiveBuildResult build_package_archive(const Specification& spec,
                                         const std::vector<FileEntry>& files);

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<FileEntry> files;  // Sorted by path
};

// Collect every regular file under `dir_path` with its mode.
// Top-level names listed in `exclude` are skipped. Symlinks are rejected.
CollectResult collect_directory_files(const std::string& dir_path,
                                      const std::vector<std::string>& exclude = {});

struct PackResult {
    bool ok = false;
    std::string error;
    Specification spec;
    std::vector<uint8_t> archive_data;
};

// Pack a source directory holding metadata.json plus the package files
PackResult pack_directory(const std::string& dir_path);

// File name an archive for `spec` is given by pack: <full_name>.lode
std::string archive_file_name(const Specification& spec);

} // namespace lode
