#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace nsync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// Absent keys keep the current value; present but malformed ones throw
template<typename T, typename Out>
static void read(const Node& node, const char* key, Out& out) {
    if (const auto n = node[key]) out = Out(n.as<T>());
}

static void readLevel(const Node& node, const char* key, spdlog::level::level_enum& out) {
    if (const auto n = node[key]) out = parseLogLevel(n.as<std::string>());
}

template<>
struct convert<WatchConfig> {
    static Node encode(const WatchConfig& rhs) {
        Node node;
        node["source"] = rhs.source.string();
        node["destination"] = rhs.destination.string();
        node["verify"] = rhs.verify;
        node["run_name_pattern"] = rhs.run_name_pattern;
        node["completion_signal_pattern"] = rhs.completion_signal_pattern;
        node["poll_interval_seconds"] = rhs.poll_interval.count();
        node["completion_delay_seconds"] = rhs.completion_delay.count();
        node["transfer_workers"] = rhs.transfer_workers;
        node["state_file"] = rhs.state_file.string();
        return node;
    }

    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        read<std::string>(node, "source", rhs.source);
        read<std::string>(node, "destination", rhs.destination);
        read<bool>(node, "verify", rhs.verify);
        read<std::string>(node, "run_name_pattern", rhs.run_name_pattern);
        read<std::string>(node, "completion_signal_pattern", rhs.completion_signal_pattern);
        read<long>(node, "poll_interval_seconds", rhs.poll_interval);
        read<long>(node, "completion_delay_seconds", rhs.completion_delay);
        if (const auto n = node["transfer_workers"]) {
            // read signed so that -1 is rejected instead of wrapping
            const auto workers = n.as<long>();
            if (workers < 1 || workers > MAX_TRANSFER_WORKERS)
                throw ConfigError("transfer_workers must be between 1 and " + std::to_string(MAX_TRANSFER_WORKERS));
            rhs.transfer_workers = static_cast<unsigned int>(workers);
        }
        read<std::string>(node, "state_file", rhs.state_file);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["nanosync"] = to_std_string(spdlog::level::to_string_view(rhs.nanosync));
        node["watch"]    = to_std_string(spdlog::level::to_string_view(rhs.watch));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["state"]    = to_std_string(spdlog::level::to_string_view(rhs.state));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        readLevel(node, "nanosync", rhs.nanosync);
        readLevel(node, "watch", rhs.watch);
        readLevel(node, "transfer", rhs.transfer);
        readLevel(node, "state", rhs.state);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        read<std::string>(node, "log_dir", rhs.log_dir);
        readLevel(node, "console_log_level", rhs.console_log_level);
        readLevel(node, "file_log_level", rhs.file_log_level);
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

}
