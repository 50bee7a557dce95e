#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace nsync::sync {

class RunMatcher {
public:
    explicit RunMatcher(const std::string& runNamePattern);

    [[nodiscard]] bool matches(const std::string& name) const;

    // Names of the immediate subdirectories of `sourceRoot` that are runs, sorted.
    // Throws filesystem_error when the root cannot be listed.
    [[nodiscard]] std::vector<std::string> candidates(const std::filesystem::path& sourceRoot) const;

private:
    std::regex pattern_;
};

}
