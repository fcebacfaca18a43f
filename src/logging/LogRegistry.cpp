#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <stdexcept>
#include <vector>

namespace usync::logging {

void LogRegistry::init(const std::optional<std::filesystem::path>& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    std::vector<spdlog::sink_ptr> sinks;

    // console
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);
    sinks.push_back(consoleSink);

    // optional file sink (rotating)
    const auto dir = logDir ? logDir : cnf.log_dir;
    if (dir && !dir->empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(*dir)) fs::create_directories(*dir);
        log_path_ = *dir / "usync.log";

        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_bytes_, max_files_);
        fileSink->set_level(cnf.levels.file_log_level);
        fileSink->set_pattern(LOG_FORMAT);
        sinks.push_back(fileSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("usync",    sub_levels.usync);
    makeLogger("storage",  sub_levels.storage);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("filters",  sub_levels.filters);
    makeLogger("remote",   sub_levels.remote);
    makeLogger("crypto",   sub_levels.crypto);

    initialized_ = true;
    LogRegistry::usync()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
