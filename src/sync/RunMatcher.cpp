#include "sync/RunMatcher.hpp"

#include <algorithm>
#include <system_error>

using namespace nsync::sync;
namespace fs = std::filesystem;

RunMatcher::RunMatcher(const std::string& runNamePattern)
    : pattern_(runNamePattern, std::regex::ECMAScript | std::regex::optimize) {}

bool RunMatcher::matches(const std::string& name) const {
    return std::regex_match(name, pattern_);
}

std::vector<std::string> RunMatcher::candidates(const fs::path& sourceRoot) const {
    std::vector<std::string> names;

    for (const auto& entry : fs::directory_iterator(sourceRoot)) {
        std::error_code ec;
        if (!entry.is_directory(ec) || ec) continue;

        auto name = entry.path().filename().string();
        if (matches(name)) names.push_back(std::move(name));
    }

    std::ranges::sort(names);
    return names;
}
