#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace nsync::util {

std::string readFileToString(const std::filesystem::path& path);

// Replaces `path` with `content` so that either the old or the new file survives a crash:
// sibling temp file, fsync, rename over the target, fsync of the parent directory.
void writeFileDurably(const std::filesystem::path& path, const std::string& content);

// Sum of regular file sizes below `root`, symlinks not followed. Throws filesystem_error.
uintmax_t directorySize(const std::filesystem::path& root);

std::string bytesToSize(uintmax_t bytes);

std::string generate_random_suffix(size_t length = 8);

}
