#pragma once

#include "token_keeper/core/models.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Forward declarations
namespace token_keeper {
namespace services {
    class HttpClient;
    class RefreshScheduler;
}
}

namespace token_keeper {
namespace core {

class CredentialStore;

// Configuration manager
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Reads and validates the file; the previous configuration is kept on failure
    std::expected<void, ConfigError> load();

    const ApplicationConfig& get() const;
    const std::filesystem::path& path() const;

    static std::filesystem::path get_default_config_path();
    static std::string sample_config();
    static std::string description();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Main application interface
class Application {
public:
    virtual ~Application() = default;

    // Lifecycle management
    // initialize(): password grant + first persist, blocking
    // start(): hands the credential to the refresh scheduler
    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void shutdown() = 0;

    // State management
    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;
    virtual std::optional<AuthError> last_auth_error() const = 0;

    // Event loop
    virtual void run() = 0;
    virtual void quit() = 0;

    // Service access
    virtual CredentialStore& get_credential_store() = 0;
    virtual std::expected<std::reference_wrapper<services::RefreshScheduler>, ApplicationError> get_refresh_scheduler() = 0;
    virtual const ApplicationConfig& get_config() const = 0;
};

// Application creation; a null http_client selects the libcurl client
std::expected<std::unique_ptr<Application>, ApplicationError> create_application(
    const ApplicationConfig& config,
    std::shared_ptr<services::HttpClient> http_client = nullptr);

} // namespace core
} // namespace token_keeper
