#pragma once

#include <filesystem>
#include <string>

namespace nsync::sync::model {

struct Run {
    std::string name;
    std::filesystem::path source_path;
    std::filesystem::path destination_path;

    // Transfers begun before this one, across restarts
    unsigned int previous_attempts{0};

    // An earlier transfer of ours put the destination in place
    bool destination_owned{false};

    Run() = default;
    Run(std::string name, const std::filesystem::path& sourceRoot, const std::filesystem::path& destinationRoot)
        : name(std::move(name)),
          source_path(sourceRoot / this->name),
          destination_path(destinationRoot / this->name) {}

    // Only a destination we created may be replaced, anything else is foreign
    [[nodiscard]] bool mayReplaceDestination() const noexcept { return destination_owned; }
};

}
