#include "sync/Copier.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

using namespace nsync::sync;
namespace fs = std::filesystem;

namespace {

bool isBenignAttributeError(const std::error_code& ec) {
    return ec == std::errc::operation_not_permitted || ec == std::errc::not_supported;
}

[[noreturn]] void throwErrno(const char* what, const fs::path& path) {
    throw fs::filesystem_error(what, path, std::error_code(errno, std::generic_category()));
}

struct FileDescriptor {
    int fd;

    explicit FileDescriptor(const int fd) : fd(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor() { if (fd >= 0) ::close(fd); }

    // Reports a failed close of a file that was written to
    void close(const fs::path& path) {
        const int rc = ::close(fd);
        fd = -1;
        if (rc != 0) throwErrno("close", path);
    }
};

}

void FilesystemCopier::copyTree(const fs::path& from, const fs::path& to,
                                const std::shared_ptr<std::atomic<bool>>& interruptFlag) {
    auto interrupted = [&] { return interruptFlag && interruptFlag->load(); };

    if (!fs::is_directory(from))
        throw fs::filesystem_error("source is not a directory", from, std::make_error_code(std::errc::not_a_directory));

    fs::create_directories(to);
    copyAttributes(from, to);

    for (fs::recursive_directory_iterator it(from), end; it != end; ++it) {
        if (interrupted()) throw CopyInterrupted();

        const auto& entry = *it;
        const auto target = to / entry.path().lexically_relative(from);
        const auto st = entry.symlink_status();

        if (fs::is_symlink(st)) {
            fs::copy_symlink(entry.path(), target);
        } else if (fs::is_directory(st)) {
            fs::create_directory(target);
            copyAttributes(entry.path(), target);
        } else if (fs::is_regular_file(st)) {
            copyFile(entry.path(), target, interruptFlag);
        } else {
            log::Registry::transfer()->debug("[Copier] Skipping special file '{}'", entry.path().string());
        }
    }
}

void FilesystemCopier::copyFile(const fs::path& from, const fs::path& to,
                                const std::shared_ptr<std::atomic<bool>>& interruptFlag) {
    FileDescriptor in(::open(from.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) throwErrno("open", from);

    FileDescriptor out(::open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (out.fd < 0) throwErrno("open", to);

    std::vector<char> buffer(CHUNK_SIZE);
    while (true) {
        if (interruptFlag && interruptFlag->load()) throw CopyInterrupted();

        const ssize_t n = ::read(in.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno("read", from);
        }
        if (n == 0) break;

        for (ssize_t done = 0; done < n;) {
            const ssize_t w = ::write(out.fd, buffer.data() + done, static_cast<size_t>(n - done));
            if (w < 0) {
                if (errno == EINTR) continue;
                throwErrno("write", to);
            }
            done += w;
        }
    }

    out.close(to);
    copyAttributes(from, to);
}

void FilesystemCopier::copyAttributes(const fs::path& from, const fs::path& to) {
    std::error_code ec;

    const auto perms = fs::status(from).permissions();
    fs::permissions(to, perms, fs::perm_options::replace, ec);
    if (ec && !isBenignAttributeError(ec)) throw fs::filesystem_error("copy permissions", from, to, ec);
    if (ec) log::Registry::transfer()->debug("[Copier] Ignoring permission error on '{}': {}", to.string(), ec.message());

    ec.clear();
    const auto mtime = fs::last_write_time(from);
    fs::last_write_time(to, mtime, ec);
    if (ec && !isBenignAttributeError(ec)) throw fs::filesystem_error("copy timestamps", from, to, ec);
    if (ec) log::Registry::transfer()->debug("[Copier] Ignoring timestamp error on '{}': {}", to.string(), ec.message());
}
