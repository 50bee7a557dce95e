#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <array>
#include <fmt/core.h>
#include <regex>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace nsync::config {

namespace fs = std::filesystem;

fs::path WatchConfig::stateFilePath() const {
    if (!state_file.empty()) return state_file;
    return destination / DEFAULT_STATE_DIR / DEFAULT_STATE_FILE;
}

Config loadConfig(const fs::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to load config file '{}': {}", path.string(), e.what()));
    }

    try {
        if (const auto node = root["watch"]; node && !YAML::convert<WatchConfig>::decode(node, cfg.watch))
            throw ConfigError(fmt::format("'watch' in config file '{}' is not a map", path.string()));
        if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw ConfigError(fmt::format("'logging' in config file '{}' is not a map", path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid value in config file '{}': {}", path.string(), e.what()));
    }

    return cfg;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    static constexpr std::array names = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    for (const auto* n : names)
        if (name == n) return spdlog::level::from_str(name);
    throw ConfigError("Unknown log level: " + name);
}

static void checkPattern(const std::string& key, const std::string& pattern) {
    try {
        std::regex re(pattern);
    } catch (const std::regex_error& e) {
        throw ConfigError(fmt::format("Invalid {} '{}': {}", key, pattern, e.what()));
    }
}

static void checkDirectory(const std::string& key, const fs::path& dir) {
    if (dir.empty()) throw ConfigError(fmt::format("Missing required {} directory", key));

    std::error_code ec;
    const auto st = fs::status(dir, ec);
    if (ec || !fs::is_directory(st))
        throw ConfigError(fmt::format("{} directory '{}' is not reachable{}", key, dir.string(),
                                      ec ? ": " + ec.message() : ""));
}

void Config::validate() const {
    checkDirectory("source", watch.source);
    checkDirectory("destination", watch.destination);
    checkPattern("run name pattern", watch.run_name_pattern);
    checkPattern("completion signal pattern", watch.completion_signal_pattern);

    if (watch.poll_interval.count() <= 0) throw ConfigError("Poll interval must be at least one second");
    if (watch.completion_delay.count() < 0) throw ConfigError("Completion delay cannot be negative");
    if (watch.transfer_workers == 0 || watch.transfer_workers > MAX_TRANSFER_WORKERS)
        throw ConfigError(fmt::format("Transfer workers must be between 1 and {}", MAX_TRANSFER_WORKERS));

    if (fs::equivalent(watch.source, watch.destination))
        throw ConfigError("Source and destination must be different directories");
}

} // namespace nsync::config
