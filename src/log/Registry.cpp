#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <vector>

namespace nsync::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks = { console_sink_ };

    // main file sink (rotating) + audit file, only when a log dir is configured
    if (!cnf.log_dir.empty()) {
        log_dir_ = cnf.log_dir;
        main_log_path_  = log_dir_ / "nanosync.log";
        audit_log_path_ = log_dir_ / "audit.log";

        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("nanosync", sub_levels.nanosync);
    makeLogger("watch",    sub_levels.watch);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("state",    sub_levels.state);

    // audit: file-only sink (append); console when no log dir is configured
    {
        std::vector<spdlog::sink_ptr> auditSinks;
        if (!cnf.log_dir.empty()) {
            audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                audit_log_path_.string(), /*truncate=*/false);
            audit_file_sink_->set_pattern(AUDIT_FORMAT);
            auditSinks.push_back(audit_file_sink_);
        } else {
            auditSinks.push_back(console_sink_);
        }
        const auto logger = std::make_shared<spdlog::logger>("audit", auditSinks.begin(), auditSinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    nanosync()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        // Replace in a copy, then swap the whole vector
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto &s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

// Called on SIGHUP so an external logrotate can move the file away
void Registry::reopenMainLog() {
    if (!initialized_ || !main_file_sink_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    audit_file_sink_.reset();
    initialized_ = false;
}

}
