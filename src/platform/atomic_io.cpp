#include "lode/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace lode {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Write the whole buffer, retrying on short writes and EINTR
bool write_all(int fd, const uint8_t* data, size_t size) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}
#endif

// Sibling of `path` that rename() can move over it
std::string staging_path_for(const std::string& path) {
    return path + ".lode-tmp-" + generate_uuid().substr(0, 8);
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "cannot create directory " + dir_path;
        return result;
    }

    std::string staging = staging_path_for(path);

#ifdef _WIN32
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        DeleteFileA(staging.c_str());
        result.error = "cannot write " + staging;
        return result;
    }

    if (!MoveFileExA(staging.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(staging.c_str());
        result.error = "cannot replace " + path;
        return result;
    }
#else
    int fd = open(staging.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        result.error = "cannot create " + staging + ": " + std::strerror(errno);
        return result;
    }

    auto abandon = [&](const std::string& what) {
        int saved = errno;
        close(fd);
        unlink(staging.c_str());
        result.error = what + " " + staging + ": " + std::strerror(saved);
        return result;
    };

    if (!write_all(fd, content.data(), content.size())) return abandon("cannot write");
    if (!fsync_fd(fd)) return abandon("cannot sync");
    close(fd);

    if (rename(staging.c_str(), path.c_str()) != 0) {
        int saved = errno;
        unlink(staging.c_str());
        result.error = "cannot replace " + path + ": " + std::strerror(saved);
        return result;
    }

    // Make the rename itself durable
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }
#endif

    result.ok = true;
    return result;
}

AtomicWriteResult write_file_with_mode(const std::string& path,
                                       const std::string& content,
                                       uint32_t mode) {
    return write_file_with_mode(path, std::vector<uint8_t>(content.begin(), content.end()), mode);
}

AtomicWriteResult write_file_with_mode(const std::string& path,
                                       const std::vector<uint8_t>& content,
                                       uint32_t mode) {
    AtomicWriteResult result;

#ifdef _WIN32
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error = "failed to create file: " + path;
        return result;
    }
    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        result.error = "failed to write file: " + path;
        return result;
    }

    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & 07777), fs::perm_options::replace, ec);
    if (ec) {
        result.error = "failed to set mode on " + path + ": " + ec.message();
        return result;
    }
    result.ok = true;
#else
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        result.error = "failed to create " + path + ": " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        int saved = errno;
        close(fd);
        result.error = "failed to write " + path + ": " + std::string(strerror(saved));
        return result;
    }

    // fchmod is not subject to the umask, so the declared mode is kept exactly
    if (fchmod(fd, static_cast<mode_t>(mode & 07777)) != 0) {
        int saved = errno;
        close(fd);
        result.error = "failed to set mode on " + path + ": " + std::string(strerror(saved));
        return result;
    }

    if (close(fd) != 0) {
        result.error = "failed to close " + path + ": " + std::string(strerror(errno));
        return result;
    }
    result.ok = true;
#endif

    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return to_portable_path(p.parent_path().string());
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return to_portable_path(path);
    return to_portable_path(abs.lexically_normal().string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_writable(const std::string& path) {
    if (!is_directory(path)) return false;
#ifdef _WIN32
    return _access(path.c_str(), 2) == 0;
#else
    return access(path.c_str(), W_OK | X_OK) == 0;
#endif
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
}

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

std::optional<uint32_t> get_file_mode(const std::string& path) {
#ifdef _WIN32
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint32_t>(status.permissions()) & 0777u;
#else
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return std::nullopt;
    return static_cast<uint32_t>(st.st_mode) & 07777u;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace lode
