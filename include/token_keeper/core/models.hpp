#pragma once

#include "token_keeper/utils/logger.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace token_keeper {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    AuthenticationFailed,
    PersistFailed,
    ConfigurationError,
    AlreadyRunning,
    NotInitialized,
    ServiceUnavailable
};

inline std::string to_string(ApplicationError error) {
    switch (error) {
        case ApplicationError::InitializationFailed: return "initialization failed";
        case ApplicationError::AuthenticationFailed: return "authentication failed";
        case ApplicationError::PersistFailed: return "token file could not be written";
        case ApplicationError::ConfigurationError: return "configuration error";
        case ApplicationError::AlreadyRunning: return "already running";
        case ApplicationError::NotInitialized: return "not initialized";
        case ApplicationError::ServiceUnavailable: return "service unavailable";
        default: return "unknown error";
    }
}

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

inline std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation failed";
        case ConfigError::PermissionDenied: return "permission denied";
        default: return "unknown error";
    }
}

// ============================================================================
// Credential types
// ============================================================================

enum class AuthError {
    ConnectionError,     // transport failure: refused, DNS, TLS, timeout
    ResponseReadError,   // body could not be read
    MalformedResponse,   // body is not a valid token shape
    ServerDeclined,      // server sent an `error` field
    IOError              // token file could not be written
};

inline std::string to_string(AuthError error) {
    switch (error) {
        case AuthError::ConnectionError: return "connection error";
        case AuthError::ResponseReadError: return "response read error";
        case AuthError::MalformedResponse: return "malformed response";
        case AuthError::ServerDeclined: return "server declined";
        case AuthError::IOError: return "I/O error";
        default: return "unknown error";
    }
}

// Static account identity, fixed for the lifetime of the process.
struct Identity {
    std::string endpoint_url;
    std::string username;
    std::string password;
    std::string client_id;
    std::string client_secret;
    std::string scope;
};

// Result of one successful token exchange.
struct TokenState {
    std::string access_token;
    std::string refresh_token;
    std::string token_type;
    std::optional<std::chrono::seconds> expires_in; // informational only

    bool operator==(const TokenState& other) const = default;
};

// Optional `{error, error_description}` payload of the authorization server.
struct ServerError {
    std::string error;
    std::string description;

    bool empty() const { return error.empty(); }
};

// ============================================================================
// Configuration structures
// ============================================================================

struct AuthConfig {
    std::string url = "https://auth.tado.com/oauth/token";
    std::string username;
    std::string password;
    std::string client_id = "public-api-preview";
    std::string client_secret;
    std::string scope = "home.user";
};

struct TokenConfig {
    std::string path = "/tmp/bearer.dat";
    // Tokens live for 10 minutes; refresh at 90% of that
    std::chrono::seconds refresh_interval{540};
};

struct HttpConfig {
    std::chrono::seconds timeout{30};
    bool verify_ssl = true;
    std::string ca_cert;    // PEM bundle replacing the system trust store when set
    std::string user_agent = "token-keeper/1.0";
};

struct ApplicationConfig {
    utils::LogLevel log_level = utils::LogLevel::Info;
    std::string log_file;

    AuthConfig auth;
    TokenConfig token;
    HttpConfig http;

    Identity identity() const {
        return Identity{
            .endpoint_url = auth.url,
            .username = auth.username,
            .password = auth.password,
            .client_id = auth.client_id,
            .client_secret = auth.client_secret,
            .scope = auth.scope
        };
    }

    bool is_valid() const;
};

} // namespace core
} // namespace token_keeper
