#include "token_keeper/utils/yaml_config.hpp"
#include "token_keeper/utils/logger.hpp"

namespace token_keeper {
namespace utils {

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::BadFile& e) {
        LOG_ERROR("YamlConfig", "Cannot read " + path.string() + ": " + std::string(e.what()));
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const std::exception& e) {
        LOG_ERROR("YamlConfig", "Parse error in " + path.string() + ": " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_string(const std::string& yaml) {
    try {
        return from_yaml(YAML::Load(yaml));
    } catch (const std::exception& e) {
        LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (!node || node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        throw YAML::Exception(node.Mark(), "configuration root must be a mapping");
    }

    if (node["log_level"]) {
        auto level = node["log_level"].as<std::string>();
        if (!is_log_level_name(level)) {
            LOG_WARNING("YamlConfig", "Unknown log level '" + level + "', using info");
        }
        config.log_level = log_level_from_string(level);
    }
    if (node["log_file"]) {
        config.log_file = node["log_file"].as<std::string>();
    }

    if (node["auth"]) {
        config.auth = parse_auth_config(node["auth"]);
    }
    if (node["token"]) {
        config.token = parse_token_config(node["token"]);
    }
    if (node["http"]) {
        config.http = parse_http_config(node["http"]);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);
    node["log_file"] = config.log_file;

    node["auth"]["url"] = config.auth.url;
    node["auth"]["username"] = config.auth.username;
    node["auth"]["password"] = config.auth.password;
    node["auth"]["client_id"] = config.auth.client_id;
    node["auth"]["client_secret"] = config.auth.client_secret;
    node["auth"]["scope"] = config.auth.scope;

    node["token"]["path"] = config.token.path;
    node["token"]["refresh_interval"] = config.token.refresh_interval.count();

    node["http"]["timeout"] = config.http.timeout.count();
    node["http"]["verify_ssl"] = config.http.verify_ssl;
    node["http"]["ca_cert"] = config.http.ca_cert;
    node["http"]["user_agent"] = config.http.user_agent;

    return node;
}

core::AuthConfig YamlConfigHelper::parse_auth_config(const YAML::Node& node) {
    core::AuthConfig config;

    if (node["url"]) {
        config.url = node["url"].as<std::string>();
    }
    if (node["username"]) {
        config.username = node["username"].as<std::string>();
    }
    if (node["password"]) {
        config.password = node["password"].as<std::string>();
    }
    if (node["client_id"]) {
        config.client_id = node["client_id"].as<std::string>();
    }
    if (node["client_secret"]) {
        config.client_secret = node["client_secret"].as<std::string>();
    }
    if (node["scope"]) {
        config.scope = node["scope"].as<std::string>();
    }

    return config;
}

core::TokenConfig YamlConfigHelper::parse_token_config(const YAML::Node& node) {
    core::TokenConfig config;

    // "bearer_token" is the key older configurations used for the file path
    if (node["path"]) {
        config.path = node["path"].as<std::string>();
    } else if (node["bearer_token"]) {
        config.path = node["bearer_token"].as<std::string>();
    }
    if (node["refresh_interval"]) {
        config.refresh_interval = std::chrono::seconds{node["refresh_interval"].as<long>()};
    }

    return config;
}

core::HttpConfig YamlConfigHelper::parse_http_config(const YAML::Node& node) {
    core::HttpConfig config;

    if (node["timeout"]) {
        config.timeout = std::chrono::seconds{node["timeout"].as<long>()};
    }
    if (node["verify_ssl"]) {
        config.verify_ssl = node["verify_ssl"].as<bool>();
    }
    if (node["ca_cert"]) {
        config.ca_cert = node["ca_cert"].as<std::string>();
    }
    if (node["user_agent"]) {
        config.user_agent = node["user_agent"].as<std::string>();
    }

    return config;
}

} // namespace utils
} // namespace token_keeper
