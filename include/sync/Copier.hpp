#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace nsync::sync {

// Thrown by a Copier when the shutdown flag stops it between files
struct CopyInterrupted : std::runtime_error {
    CopyInterrupted() : std::runtime_error("copy interrupted") {}
};

// Recursive copy of a directory tree into a destination that does not exist yet.
// Failures are thrown (filesystem_error or runtime_error).
class Copier {
public:
    virtual ~Copier() = default;

    virtual void copyTree(const std::filesystem::path& from, const std::filesystem::path& to,
                          const std::shared_ptr<std::atomic<bool>>& interruptFlag) = 0;
};

class FilesystemCopier final : public Copier {
public:
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;

    void copyTree(const std::filesystem::path& from, const std::filesystem::path& to,
                  const std::shared_ptr<std::atomic<bool>>& interruptFlag) override;

    // Copies one regular file CHUNK_SIZE bytes at a time, checking the flag before each chunk.
    // An interrupted copy leaves a partial `to` behind.
    static void copyFile(const std::filesystem::path& from, const std::filesystem::path& to,
                         const std::shared_ptr<std::atomic<bool>>& interruptFlag);

private:

    // Permissions and timestamps are best effort: network mounts often refuse them with EPERM
    static void copyAttributes(const std::filesystem::path& from, const std::filesystem::path& to);
};

}
