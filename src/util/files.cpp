#include "util/files.hpp"

#include <array>
#include <cerrno>
#include <cmath>
#include <fcntl.h>
#include <fmt/core.h>
#include <fstream>
#include <random>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwErrno(const std::string& what, const fs::path& path) {
    throw fs::filesystem_error(what, path, std::error_code(errno, std::generic_category()));
}

void writeAll(const int fd, const std::string& content, const fs::path& path) {
    const char* p = content.data();
    size_t n = content.size();
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            throwErrno("write", path);
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
}

void fsyncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) throwErrno("open directory", dir);
    const int rc = ::fsync(fd);
    const int savedErrno = errno;
    ::close(fd);
    // Some network filesystems refuse fsync on directories
    if (rc != 0 && savedErrno != EINVAL && savedErrno != ENOTSUP) {
        errno = savedErrno;
        throwErrno("fsync directory", dir);
    }
}

}

std::string nsync::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void nsync::util::writeFileDurably(const fs::path& path, const std::string& content) {
    const auto dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    const auto tmp = dir / fmt::format(".{}.{}.tmp", path.filename().string(), generate_random_suffix());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throwErrno("open", tmp);

    try {
        writeAll(fd, content, tmp);
        if (::fsync(fd) != 0) throwErrno("fsync", tmp);
    } catch (...) {
        ::close(fd);
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    if (::close(fd) != 0) {
        const int savedErrno = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        errno = savedErrno;
        throwErrno("close", tmp);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int savedErrno = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        errno = savedErrno;
        throwErrno("rename", path);
    }

    fsyncDirectory(dir);
}

uintmax_t nsync::util::directorySize(const fs::path& root) {
    uintmax_t total = 0;
    for (fs::recursive_directory_iterator it(root), end; it != end; ++it) {
        const auto& entry = *it;
        if (entry.is_symlink()) continue;
        if (entry.is_regular_file()) total += entry.file_size();
    }
    return total;
}

std::string nsync::util::bytesToSize(uintmax_t bytes) {
    static constexpr std::array<const char*, 5> suffix = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}

std::string nsync::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}
