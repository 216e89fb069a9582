#include "token_keeper/core/application.hpp"
#include "token_keeper/core/credential_store.hpp"
#include "token_keeper/services/auth/auth_client.hpp"
#include "token_keeper/services/auth/refresh_scheduler.hpp"
#include "token_keeper/services/auth/token_persister.hpp"
#include "token_keeper/services/network/http_client.hpp"
#include "token_keeper/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace token_keeper {
namespace core {

namespace {
    std::shared_ptr<services::HttpClient> make_default_http_client(const ApplicationConfig& config) {
        services::HttpClientConfig http_config;
        http_config.default_timeout = config.http.timeout;
        http_config.user_agent = config.http.user_agent;
        http_config.verify_ssl = config.http.verify_ssl;
        if (!config.http.ca_cert.empty()) {
            http_config.ca_cert_path = config.http.ca_cert;
        }
        return services::create_http_client(http_config);
    }
}

class ApplicationImpl : public Application {
public:
    ApplicationImpl(const ApplicationConfig& config, std::shared_ptr<services::HttpClient> http_client)
        : m_config(config),
          m_http_client(std::move(http_client)),
          m_credentials(config.identity()),
          m_auth_client(m_http_client) {
        LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        if (m_scheduler && m_state != ApplicationState::Stopped) {
            shutdown();
        }
        LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;

        auto token = m_auth_client.authenticate(m_credentials.identity());
        if (!token) {
            LOG_ERROR("Application", "Initial authentication against " + m_config.auth.url +
                      " failed: " + to_string(token.error()));
            set_auth_error(token.error());
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::AuthenticationFailed);
        }

        m_credentials.replace_state(token.value());

        auto persisted = services::TokenPersister::persist(token->access_token, m_config.token.path);
        if (!persisted) {
            LOG_ERROR("Application", "Could not store initial token in " + m_config.token.path);
            set_auth_error(persisted.error());
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::PersistFailed);
        }

        m_state = ApplicationState::Running;
        LOG_INFO("Application", "Initialization complete, token stored in " + m_config.token.path);
        return {};
    }

    std::expected<void, ApplicationError> start() override {
        LOG_INFO("Application", "Starting refresh scheduler...");

        if (m_state != ApplicationState::Running) {
            LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::NotInitialized);
        }
        if (m_scheduler) {
            LOG_WARNING("Application", "Refresh scheduler already started");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_scheduler = std::make_unique<services::RefreshScheduler>(
            m_credentials, m_auth_client, m_config.token.path,
            std::chrono::duration_cast<std::chrono::milliseconds>(m_config.token.refresh_interval));

        // Raised before the scheduler starts so an early quit() is not overwritten
        m_running = true;
        if (!m_scheduler->start()) {
            m_running = false;
            m_scheduler.reset();
            return std::unexpected(ApplicationError::InitializationFailed);
        }

        return {};
    }

    void shutdown() override {
        LOG_INFO("Application", "Shutting down...");
        m_state = ApplicationState::Stopping;
        m_running = false;

        if (m_scheduler) {
            m_scheduler->stop();
            if (auto error = m_scheduler->last_error()) {
                set_auth_error(*error);
            }
        }

        m_state = ApplicationState::Stopped;
        LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_running;
    }

    std::optional<AuthError> last_auth_error() const override {
        std::lock_guard lock(m_error_mutex);
        return m_last_auth_error;
    }

    void run() override {
        LOG_INFO("Application", "Main loop started");
        while (is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        LOG_INFO("Application", "Main loop ended");
    }

    // Only touches an atomic so it may be called from a signal handler
    void quit() override {
        m_running = false;
    }

    CredentialStore& get_credential_store() override {
        return m_credentials;
    }

    std::expected<std::reference_wrapper<services::RefreshScheduler>, ApplicationError> get_refresh_scheduler() override {
        if (!m_scheduler) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return std::ref(*m_scheduler);
    }

    const ApplicationConfig& get_config() const override {
        return m_config;
    }

private:
    void set_auth_error(AuthError error) {
        std::lock_guard lock(m_error_mutex);
        m_last_auth_error = error;
    }

    const ApplicationConfig m_config;
    std::shared_ptr<services::HttpClient> m_http_client;
    CredentialStore m_credentials;
    services::AuthClient m_auth_client;
    std::unique_ptr<services::RefreshScheduler> m_scheduler;

    std::atomic<ApplicationState> m_state{ApplicationState::NotInitialized};
    std::atomic<bool> m_running{false};

    mutable std::mutex m_error_mutex;
    std::optional<AuthError> m_last_auth_error;
};

std::expected<std::unique_ptr<Application>, ApplicationError> create_application(
    const ApplicationConfig& config,
    std::shared_ptr<services::HttpClient> http_client) {
    if (!config.is_valid()) {
        LOG_ERROR("Application", "Refusing to start with an invalid configuration");
        return std::unexpected(ApplicationError::ConfigurationError);
    }

    if (!http_client) {
        http_client = make_default_http_client(config);
    }

    std::unique_ptr<Application> app = std::make_unique<ApplicationImpl>(config, std::move(http_client));
    return app;
}

} // namespace core
} // namespace token_keeper
