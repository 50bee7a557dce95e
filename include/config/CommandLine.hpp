#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace nsync::config {

// Malformed command line (unknown flag, missing value); exit code 2
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    enum class Action : uint8_t { WATCH, LIST, RESET, HELP };

    Action action{Action::WATCH};
    Config config;
    std::string reset_run;
    bool force{false};
    std::string help;

    // Defaults, then the --config file, then the remaining flags
    static CommandLine parse(int argc, const char* const argv[]);
    static CommandLine parse(const std::vector<std::string>& args);
};

}
