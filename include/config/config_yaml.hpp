#pragma once

#include "config/Config.hpp"
#include "util/timestamp.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace usync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template <typename T>
static std::optional<T> optionalAs(const Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<T>();
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["usync"]    = to_std_string(spdlog::level::to_string_view(rhs.usync));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["filters"]  = to_std_string(spdlog::level::to_string_view(rhs.filters));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["crypto"]   = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.usync = spdlog::level::from_str(node["usync"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.filters = spdlog::level::from_str(node["filters"].as<std::string>("warn"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (rhs.log_dir) node["log_dir"] = rhs.log_dir->string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto dir = optionalAs<std::string>(node["log_dir"])) rhs.log_dir = *dir;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["zero_copy_threshold_bytes"] = rhs.zero_copy_threshold_bytes;
        node["ram_warn_threshold_bytes"] = rhs.ram_warn_threshold_bytes;
        node["parallel"] = rhs.parallel;
        node["max_workers"] = rhs.max_workers;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.zero_copy_threshold_bytes = node["zero_copy_threshold_bytes"].as<uint64_t>(DEFAULT_ZERO_COPY_THRESHOLD);
        rhs.ram_warn_threshold_bytes = node["ram_warn_threshold_bytes"].as<uint64_t>(DEFAULT_RAM_WARN_THRESHOLD);
        rhs.parallel = node["parallel"].as<bool>(true);
        rhs.max_workers = node["max_workers"].as<unsigned int>(0);
        return true;
    }
};

// Dates are accepted either as epoch seconds or as ISO-8601 UTC ("2024-01-31T00:00:00Z")
static std::optional<uint64_t> decodeDate(const Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    const auto raw = node.as<std::string>();
    if (!raw.empty() && raw.find_first_not_of("0123456789") == std::string::npos) return std::stoull(raw);
    return static_cast<uint64_t>(usync::util::parseTimestampFromString(raw));
}

template<>
struct convert<FiltersConfig> {
    static Node encode(const FiltersConfig& rhs) {
        Node node;
        node["include"] = rhs.include;
        node["exclude"] = rhs.exclude;
        if (rhs.min_size) node["min_size"] = *rhs.min_size;
        if (rhs.max_size) node["max_size"] = *rhs.max_size;
        if (rhs.min_date) node["min_date"] = *rhs.min_date;
        if (rhs.max_date) node["max_date"] = *rhs.max_date;
        return node;
    }

    static bool decode(const Node& node, FiltersConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["include"]) rhs.include = node["include"].as<std::vector<std::string>>();
        if (node["exclude"]) rhs.exclude = node["exclude"].as<std::vector<std::string>>();
        rhs.min_size = optionalAs<uint64_t>(node["min_size"]);
        rhs.max_size = optionalAs<uint64_t>(node["max_size"]);
        rhs.min_date = decodeDate(node["min_date"]);
        rhs.max_date = decodeDate(node["max_date"]);
        return true;
    }
};

template<>
struct convert<DefaultsConfig> {
    static Node encode(const DefaultsConfig& rhs) {
        Node node;
        node["verbose"] = rhs.verbose;
        node["progress"] = rhs.progress;
        node["use_ram"] = rhs.use_ram;
        node["recursive"] = rhs.recursive;
        node["dry_run"] = rhs.dry_run;
        node["ssh_opts"] = rhs.ssh_opts;
        if (rhs.checksum) node["checksum"] = *rhs.checksum;
        node["sync_mode"] = rhs.sync_mode;
        node["filters"] = rhs.filters;
        return node;
    }

    static bool decode(const Node& node, DefaultsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.verbose = node["verbose"].as<bool>(false);
        rhs.progress = node["progress"].as<bool>(false);
        rhs.use_ram = node["use_ram"].as<bool>(false);
        rhs.recursive = node["recursive"].as<bool>(false);
        rhs.dry_run = node["dry_run"].as<bool>(false);
        if (node["ssh_opts"]) rhs.ssh_opts = node["ssh_opts"].as<std::vector<std::string>>();
        rhs.checksum = optionalAs<std::string>(node["checksum"]);
        rhs.sync_mode = node["sync_mode"].as<std::string>("one_way");
        if (node["filters"]) rhs.filters = node["filters"].as<FiltersConfig>();
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["scp_bin"] = rhs.scp_bin;
        node["ssh_bin"] = rhs.ssh_bin;
        node["aws_bin"] = rhs.aws_bin;
        if (rhs.s3_endpoint_url) node["s3_endpoint_url"] = *rhs.s3_endpoint_url;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.scp_bin = node["scp_bin"].as<std::string>("scp");
        rhs.ssh_bin = node["ssh_bin"].as<std::string>("ssh");
        rhs.aws_bin = node["aws_bin"].as<std::string>("aws");
        rhs.s3_endpoint_url = optionalAs<std::string>(node["s3_endpoint_url"]);
        return true;
    }
};

}
