#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace usync::config {

constexpr static uint64_t DEFAULT_ZERO_COPY_THRESHOLD = 1024 * 1024;          // 1MB
constexpr static uint64_t DEFAULT_RAM_WARN_THRESHOLD = 100 * 1024 * 1024;     // 100MB

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum usync     = spdlog::level::info;   // Top-level events, summaries
    spdlog::level::level_enum storage   = spdlog::level::warn;   // Backend I/O failures
    spdlog::level::level_enum transfer  = spdlog::level::info;   // Verbose/progress echoes live here
    spdlog::level::level_enum sync      = spdlog::level::info;
    spdlog::level::level_enum filters   = spdlog::level::warn;
    spdlog::level::level_enum remote    = spdlog::level::warn;   // External tool failures
    spdlog::level::level_enum crypto    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::optional<std::filesystem::path> log_dir;
    LogLevelsConfig levels;
};

struct TransferConfig {
    uint64_t zero_copy_threshold_bytes = DEFAULT_ZERO_COPY_THRESHOLD;
    uint64_t ram_warn_threshold_bytes = DEFAULT_RAM_WARN_THRESHOLD;
    bool parallel = true;
    unsigned int max_workers = 0; // 0: hardware concurrency
};

struct FiltersConfig {
    std::vector<std::string> include, exclude;
    std::optional<uint64_t> min_size, max_size;
    std::optional<uint64_t> min_date, max_date; // epoch seconds

    [[nodiscard]] bool empty() const {
        return include.empty() && exclude.empty() && !min_size && !max_size && !min_date && !max_date;
    }
};

struct DefaultsConfig {
    bool verbose = false;
    bool progress = false;
    bool use_ram = false;
    bool recursive = false;
    bool dry_run = false;
    std::vector<std::string> ssh_opts;
    std::optional<std::string> checksum;  // md5 | sha1 | sha256
    std::string sync_mode = "one_way";    // one_way | copy_only | two_way
    FiltersConfig filters;
};

struct RemoteConfig {
    std::string scp_bin = "scp";
    std::string ssh_bin = "ssh";
    std::string aws_bin = "aws";
    std::optional<std::string> s3_endpoint_url;
};

struct Config {
    LoggingConfig logging;
    TransferConfig transfer;
    DefaultsConfig defaults;
    RemoteConfig remote;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace usync::config
