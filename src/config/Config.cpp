#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace usync::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["defaults"]) YAML::convert<DefaultsConfig>::decode(node, cfg.defaults);
    if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);

    return cfg;
}

} // namespace usync::config
