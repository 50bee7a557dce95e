#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace nsync::config {

// Sequencer run folders: date, time, device id, flow-cell id, run id
constexpr static auto DEFAULT_RUN_NAME_PATTERN = R"([0-9]{8}_[0-9]{4}_[^_]+_[^_]+_[a-f0-9]{8})";
constexpr static auto DEFAULT_COMPLETION_SIGNAL_PATTERN = R"(.*/final_summary.*\.txt$)";
constexpr static auto DEFAULT_STATE_DIR = ".nanosync";
constexpr static auto DEFAULT_STATE_FILE = "state.yaml";
constexpr static unsigned int MAX_TRANSFER_WORKERS = 64;

// Fatal configuration problem, reported once at startup
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct WatchConfig {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool verify = true;
    std::string run_name_pattern = DEFAULT_RUN_NAME_PATTERN;
    std::string completion_signal_pattern = DEFAULT_COMPLETION_SIGNAL_PATTERN;
    std::chrono::seconds poll_interval{30};
    std::chrono::seconds completion_delay{0};
    unsigned int transfer_workers = 1;
    std::filesystem::path state_file; // empty: <destination>/.nanosync/state.yaml

    [[nodiscard]] std::filesystem::path stateFilePath() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum nanosync = spdlog::level::info;   // startup/shutdown
    spdlog::level::level_enum watch    = spdlog::level::info;   // discovery and readiness per cycle
    spdlog::level::level_enum transfer = spdlog::level::info;   // copies and verification
    spdlog::level::level_enum state    = spdlog::level::info;   // persisted transitions
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty: console only
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    WatchConfig watch;
    LoggingConfig logging;

    // Compiles the patterns and checks both roots; throws ConfigError
    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);

spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace nsync::config
