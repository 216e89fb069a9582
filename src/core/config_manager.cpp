#include "token_keeper/core/application.hpp"
#include "token_keeper/utils/config_validator.hpp"
#include "token_keeper/utils/yaml_config.hpp"
#include "token_keeper/utils/logger.hpp"
#include <cstdlib>
#include <shared_mutex>
#include <sstream>

namespace token_keeper {
namespace core {

// Configuration manager implementation

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? get_default_config_path() : config_path) {
        LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        LOG_DEBUG("ConfigService", "Loading configuration");

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return std::unexpected(result.error());
        }

        auto validation = utils::ConfigValidator::validate_application_config(*result);
        for (const auto& warning : validation.warnings) {
            LOG_WARNING("ConfigService", warning);
        }
        if (!validation.is_valid) {
            LOG_ERROR("ConfigService", "Invalid configuration in " + m_config_path.string() + ": " +
                      validation.get_error_summary());
            return std::unexpected(ConfigError::ValidationError);
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(result.value());
        LOG_DEBUG("ConfigService", "Configuration loaded");
        return {};
    }

    const ApplicationConfig& get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

private:
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    mutable std::shared_mutex m_mutex;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {
}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::filesystem::path ConfigManager::get_default_config_path() {
    std::filesystem::path config_dir;

    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        config_dir = std::filesystem::path(xdg_config) / "token-keeper";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "token-keeper";
    } else {
        config_dir = std::filesystem::current_path();
    }

    return config_dir / "config.yaml";
}

std::string ConfigManager::sample_config() {
    std::stringstream content;
    content << "# token-keeper configuration\n";
    content << "# Obtains an OAuth2 bearer token with the password grant, refreshes it\n";
    content << "# before it expires and stores the access token in a file.\n\n";
    content << "# log_level: debug, info, warning, error or none\n";
    content << "# log_file: optional log file, console only when empty\n";
    content << "# auth.url: OAuth2 token endpoint\n";
    content << "# auth.username / auth.password: account credentials\n";
    content << "# auth.client_id / auth.client_secret: OAuth2 client registration\n";
    content << "# auth.scope: requested scope\n";
    content << "# token.path: file receiving the raw access token\n";
    content << "# token.refresh_interval: seconds between refreshes, below the token lifetime\n";
    content << "# http.timeout: request timeout in seconds (1-300)\n";
    content << "# http.verify_ssl: verify the server certificate\n";
    content << "# http.ca_cert: optional PEM bundle used instead of the system CAs\n\n";

    YAML::Emitter emitter;
    emitter << utils::YamlConfigHelper::to_yaml(ApplicationConfig{});
    content << emitter.c_str() << "\n";
    return content.str();
}

std::string ConfigManager::description() {
    return "Keeps an OAuth2 bearer token fresh and stores it in a file";
}

} // namespace core
} // namespace token_keeper
