#include "lode/archive.hpp"
#include "lode/path_utils.hpp"
#include "lode/platform.hpp"
#include "lode/types.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <zlib.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lode {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_UID_SIZE = 8;
static constexpr size_t TAR_GID_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_MTIME_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_MAGIC_SIZE = 6;
static constexpr size_t TAR_VERSION_SIZE = 2;
static constexpr size_t TAR_UNAME_SIZE = 32;
static constexpr size_t TAR_GNAME_SIZE = 32;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Tar type flags
static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];         // 0
    char mode[TAR_MODE_SIZE];         // 100
    char uid[TAR_UID_SIZE];           // 108
    char gid[TAR_GID_SIZE];           // 116
    char size[TAR_SIZE_SIZE];         // 124
    char mtime[TAR_MTIME_SIZE];       // 136
    char chksum[TAR_CHKSUM_SIZE];     // 148
    char typeflag;                    // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[TAR_MAGIC_SIZE];       // 257
    char version[TAR_VERSION_SIZE];   // 263
    char uname[TAR_UNAME_SIZE];       // 265
    char gname[TAR_GNAME_SIZE];       // 297
    char devmajor[8];                 // 329
    char devminor[8];                 // 337
    char prefix[TAR_PREFIX_SIZE];     // 345
    char padding[12];                 // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

struct TarFile {
    std::string path;
    uint32_t mode;
    const std::vector<uint8_t>* data;
};

// ============================================================================
// Tar Helpers
// ============================================================================

void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field counts as spaces
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }
    return sum;
}

// Parse an octal field; fails on characters outside 0-7 before the terminator
bool parse_octal(const char* data, size_t size, uint64_t& out) {
    out = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] < '0' || data[i] > '7') {
            return false;
        }
        out = (out << 3) | static_cast<uint64_t>(data[i] - '0');
    }
    return true;
}

bool create_tar_header(const std::string& path, uint32_t mode, uint64_t size,
                       TarHeader& header, std::string& error) {
    std::memset(&header, 0, sizeof(header));

    if (path.size() <= TAR_NAME_SIZE) {
        std::memcpy(header.name, path.data(), path.size());
    } else {
        // Split into prefix/name at a separator
        size_t split = path.rfind('/', TAR_PREFIX_SIZE);
        if (split == std::string::npos || path.size() - split - 1 > TAR_NAME_SIZE ||
            split == 0) {
            error = "path too long for archive: " + path;
            return false;
        }
        std::memcpy(header.prefix, path.data(), split);
        std::memcpy(header.name, path.data() + split + 1, path.size() - split - 1);
    }

    write_octal(header.mode, TAR_MODE_SIZE, mode & 07777);
    write_octal(header.uid, TAR_UID_SIZE, 0);
    write_octal(header.gid, TAR_GID_SIZE, 0);
    write_octal(header.size, TAR_SIZE_SIZE, size);
    write_octal(header.mtime, TAR_MTIME_SIZE, 0);
    header.typeflag = TAR_REGTYPE;

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';

    uint32_t checksum = calculate_checksum(header);

    // 6 octal digits + NUL + space
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
    return true;
}

// ============================================================================
// Gzip
// ============================================================================

// Deterministic gzip: mtime=0, no original filename, OS=255
bool gzip_compress(const std::vector<uint8_t>& data, std::vector<uint8_t>& out) {
    out = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xff};

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits); header and trailer are written here
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    std::vector<uint8_t> compressed(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    uLong total_out = strm.total_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return false;
    }

    out.insert(out.end(), compressed.begin(), compressed.begin() + static_cast<std::ptrdiff_t>(total_out));

    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    uint32_t size = static_cast<uint32_t>(data.size());
    for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<uint8_t>((crc >> shift) & 0xff));
    for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<uint8_t>((size >> shift) & 0xff));
    return true;
}

bool gzip_decompress(const std::vector<uint8_t>& data, std::vector<uint8_t>& out, std::string& error) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        error = "not a gzip stream";
        return false;
    }
    if (data[2] != 0x08) {
        error = "unsupported gzip compression method";
        return false;
    }

    size_t offset = 10;
    uint8_t flags = data[3];

    // FEXTRA
    if (flags & 0x04) {
        if (offset + 2 > data.size()) { error = "truncated gzip header"; return false; }
        uint16_t xlen = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
        offset += 2 + xlen;
    }
    // FNAME
    if (flags & 0x08) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    // FCOMMENT
    if (flags & 0x10) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    // FHCRC
    if (flags & 0x02) {
        offset += 2;
    }

    if (offset + 8 > data.size()) {
        error = "truncated gzip header";
        return false;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -15) != Z_OK) {
        error = "inflateInit failed";
        return false;
    }

    strm.next_in = const_cast<Bytef*>(data.data() + offset);
    strm.avail_in = static_cast<uInt>(data.size() - offset - 8);

    out.clear();
    uint8_t chunk[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk;
        strm.avail_out = sizeof(chunk);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            error = "corrupt gzip data";
            return false;
        }
        size_t produced = sizeof(chunk) - strm.avail_out;
        out.insert(out.end(), chunk, chunk + produced);
        if (ret == Z_OK && produced == 0 && strm.avail_in == 0) {
            inflateEnd(&strm);
            error = "truncated gzip data";
            return false;
        }
    }
    inflateEnd(&strm);

    const uint8_t* trailer = data.data() + data.size() - 8;
    uint32_t expected_crc = static_cast<uint32_t>(trailer[0]) |
                            (static_cast<uint32_t>(trailer[1]) << 8) |
                            (static_cast<uint32_t>(trailer[2]) << 16) |
                            (static_cast<uint32_t>(trailer[3]) << 24);
    uint32_t actual_crc = static_cast<uint32_t>(crc32(0, out.data(), static_cast<uInt>(out.size())));
    if (expected_crc != actual_crc) {
        error = "gzip checksum mismatch";
        return false;
    }

    return true;
}

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Reading
// ============================================================================

ArchiveReadResult read_package_archive(const std::vector<uint8_t>& data,
                                       const std::string& source_path) {
    ArchiveReadResult result;
    result.archive.source_path = source_path;

    std::vector<uint8_t> tar_data;
    std::string gz_error;
    if (!gzip_decompress(data, tar_data, gz_error)) {
        result.error = "failed to decompress archive: " + gz_error;
        return result;
    }

    bool have_metadata = false;
    std::string metadata_json;
    size_t offset = 0;

    while (true) {
        if (offset + TAR_BLOCK_SIZE > tar_data.size()) {
            result.error = "truncated archive: missing end-of-archive marker";
            return result;
        }

        const uint8_t* block = tar_data.data() + offset;
        if (is_zero_block(block)) break;

        const TarHeader* header = reinterpret_cast<const TarHeader*>(block);

        uint64_t stored_checksum = 0;
        if (!parse_octal(header->chksum, TAR_CHKSUM_SIZE, stored_checksum) ||
            stored_checksum != calculate_checksum(*header)) {
            result.error = "corrupt tar header at offset " + std::to_string(offset);
            return result;
        }

        std::string path;
        if (header->prefix[0] != '\0') {
            path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
            path += '/';
        }
        path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        if (path.rfind("./", 0) == 0) {
            path = path.substr(2);
        }

        uint64_t size = 0;
        uint64_t mode = 0;
        if (!parse_octal(header->size, TAR_SIZE_SIZE, size) ||
            !parse_octal(header->mode, TAR_MODE_SIZE, mode)) {
            result.error = "corrupt tar header for " + path;
            return result;
        }

        char typeflag = header->typeflag;
        if (typeflag == TAR_SYMTYPE || typeflag == TAR_LNKTYPE) {
            result.error = "symlinks and hardlinks not permitted: " + path;
            return result;
        }

        offset += TAR_BLOCK_SIZE;

        if (typeflag == TAR_DIRTYPE) {
            // Directories are implied by file paths
            continue;
        }
        if (typeflag != TAR_REGTYPE && typeflag != TAR_AREGTYPE) {
            result.error = "unsupported entry type: " + path;
            return result;
        }

        if (size > tar_data.size() - offset) {
            result.error = "truncated archive: " + path;
            return result;
        }

        auto begin = tar_data.begin() + static_cast<std::ptrdiff_t>(offset);
        auto end = begin + static_cast<std::ptrdiff_t>(size);

        if (path == ARCHIVE_METADATA_ENTRY) {
            metadata_json.assign(begin, end);
            have_metadata = true;
        } else if (path.rfind(ARCHIVE_DATA_PREFIX, 0) == 0) {
            std::string rel = path.substr(std::strlen(ARCHIVE_DATA_PREFIX));
            auto normalized = normalize_under_root("", rel);
            if (!normalized.ok) {
                result.error = std::string(path_error_to_string(normalized.error)) + ": " + rel;
                return result;
            }

            FileEntry entry;
            entry.path = normalized.path;
            entry.mode = static_cast<uint32_t>(mode & 07777);
            if (entry.mode == 0) entry.mode = 0644;
            entry.content.assign(begin, end);
            result.archive.files.push_back(std::move(entry));
        } else {
            result.error = "unexpected archive entry: " + path;
            return result;
        }

        size_t blocks = static_cast<size_t>((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE);
        offset += blocks * TAR_BLOCK_SIZE;
    }

    if (!have_metadata) {
        result.error = std::string("archive has no ") + ARCHIVE_METADATA_ENTRY;
        return result;
    }

    auto spec_result = parse_specification(metadata_json);
    if (!spec_result.ok) {
        result.error = std::string("invalid ") + ARCHIVE_METADATA_ENTRY + ": " + spec_result.error;
        return result;
    }
    result.archive.spec = std::move(spec_result.spec);

    spdlog::debug("read archive {} ({} files)", result.archive.spec.full_name(),
                  result.archive.files.size());
    result.ok = true;
    return result;
}

ArchiveReadResult read_package_archive(const std::string& path) {
    auto data = read_file_bytes(path);
    if (!data) {
        ArchiveReadResult result;
        result.archive.source_path = path;
        result.error = "failed to open archive: " + path;
        return result;
    }
    return read_package_archive(*data, path);
}

// ============================================================================
// Writing
// ============================================================================

ArchiveBuildResult build_package_archive(const Specification& spec,
                                         const std::vector<FileEntry>& files) {
    ArchiveBuildResult result;

    std::string error;
    if (!validate_specification(spec, error)) {
        result.error = error;
        return result;
    }

    std::vector<uint8_t> metadata;
    {
        std::string json = serialize_specification(spec) + "\n";
        metadata.assign(json.begin(), json.end());
    }

    std::vector<TarFile> entries;
    entries.push_back({ARCHIVE_METADATA_ENTRY, 0644, &metadata});

    for (const auto& file : files) {
        auto normalized = normalize_under_root("", file.path);
        if (!normalized.ok) {
            result.error = std::string(path_error_to_string(normalized.error)) + ": " + file.path;
            return result;
        }
        entries.push_back({ARCHIVE_DATA_PREFIX + normalized.path, file.mode, &file.content});
    }

    // metadata.json stays the first entry
    std::sort(entries.begin() + 1, entries.end(),
              [](const TarFile& a, const TarFile& b) { return a.path < b.path; });

    for (size_t i = 2; i < entries.size(); ++i) {
        if (entries[i].path == entries[i - 1].path) {
            result.error = "duplicate file entry: " + entries[i].path;
            return result;
        }
    }

    std::vector<uint8_t> tar_data;
    for (const auto& entry : entries) {
        TarHeader header;
        if (!create_tar_header(entry.path, entry.mode, entry.data->size(), header, error)) {
            result.error = error;
            return result;
        }
        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header);
        tar_data.insert(tar_data.end(), header_bytes, header_bytes + TAR_BLOCK_SIZE);

        tar_data.insert(tar_data.end(), entry.data->begin(), entry.data->end());
        size_t padding = (TAR_BLOCK_SIZE - (entry.data->size() % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
        tar_data.insert(tar_data.end(), padding, 0);
    }

    // Two empty blocks mark the end of the archive
    tar_data.insert(tar_data.end(), TAR_BLOCK_SIZE * 2, 0);

    if (!gzip_compress(tar_data, result.archive_data)) {
        result.archive_data.clear();
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_directory_files(const std::string& dir_path,
                                      const std::vector<std::string>& exclude) {
    CollectResult result;

    if (!is_directory(dir_path)) {
        result.error = "directory not found: " + dir_path;
        return result;
    }

    fs::path base_path(dir_path);

    try {
        auto it = fs::recursive_directory_iterator(dir_path);
        for (; it != fs::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;
            std::string path_str = to_portable_path(fs::relative(entry.path(), base_path).string());

            if (it.depth() == 0 &&
                std::find(exclude.begin(), exclude.end(), path_str) != exclude.end()) {
                if (entry.is_directory()) it.disable_recursion_pending();
                continue;
            }

            if (entry.is_symlink()) {
                result.error = "symlinks are not permitted: " + path_str;
                return result;
            }
            if (entry.is_directory()) {
                continue;
            }
            if (!entry.is_regular_file()) {
                result.error = "unsupported file type: " + path_str;
                return result;
            }

            FileEntry file;
            file.path = path_str;

            auto content = read_file_bytes(entry.path().string());
            if (!content) {
                result.error = "failed to read file: " + path_str;
                return result;
            }
            file.content = std::move(*content);

            auto mode = get_file_mode(entry.path().string());
            file.mode = mode ? (*mode & 0777) : 0644;

            result.files.push_back(std::move(file));
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });

    result.ok = true;
    return result;
}

PackResult pack_directory(const std::string& dir_path) {
    PackResult result;

    std::string metadata_path = join_path(dir_path, ARCHIVE_METADATA_ENTRY);
    auto metadata = read_text_file(metadata_path);
    if (!metadata) {
        result.error = "missing " + metadata_path;
        return result;
    }

    auto spec_result = parse_specification(*metadata);
    if (!spec_result.ok) {
        result.error = metadata_path + ": " + spec_result.error;
        return result;
    }
    result.spec = spec_result.spec;

    auto collected = collect_directory_files(dir_path, {ARCHIVE_METADATA_ENTRY});
    if (!collected.ok) {
        result.error = collected.error;
        return result;
    }

    auto built = build_package_archive(result.spec, collected.files);
    if (!built.ok) {
        result.error = built.error;
        return result;
    }

    result.archive_data = std::move(built.archive_data);
    result.ok = true;
    return result;
}

std::string archive_file_name(const Specification& spec) {
    return spec.full_name() + layout::ARCHIVE_EXTENSION;
}

} // namespace lode
