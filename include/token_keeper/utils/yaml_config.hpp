#pragma once

#include "token_keeper/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace token_keeper {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Parse configuration from YAML text
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_string(const std::string& yaml);

    // Convert between YAML nodes and config structures
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static core::AuthConfig parse_auth_config(const YAML::Node& node);
    static core::TokenConfig parse_token_config(const YAML::Node& node);
    static core::HttpConfig parse_http_config(const YAML::Node& node);
};

} // namespace utils
} // namespace token_keeper
