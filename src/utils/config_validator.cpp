#include "token_keeper/utils/config_validator.hpp"
#include "token_keeper/utils/url_utils.hpp"
#include <filesystem>
#include <system_error>

namespace token_keeper::utils {

ValidationResult ConfigValidator::validate_auth_config(const core::AuthConfig& config) {
    ValidationResult result;

    if (config.url.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Authorization URL cannot be empty");
    } else if (!UrlUtils::is_valid_url(config.url)) {
        result.add_error(ValidationError::InvalidUrl, "Invalid authorization URL: " + config.url);
    } else if (UrlUtils::get_scheme(config.url) == "http") {
        result.add_warning("Authorization URL uses plain http; credentials are sent unencrypted");
    }

    if (config.username.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Username cannot be empty");
    }
    if (config.password.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Password cannot be empty");
    }
    if (config.client_id.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Client ID cannot be empty");
    }
    if (config.client_secret.empty()) {
        result.add_warning("Client secret is empty; most authorization servers reject this");
    }

    return result;
}

ValidationResult ConfigValidator::validate_token_config(const core::TokenConfig& config) {
    ValidationResult result;

    if (config.path.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Token file path cannot be empty");
    }

    if (config.refresh_interval < std::chrono::seconds{1}) {
        result.add_error(ValidationError::InvalidRefreshInterval,
            "Refresh interval must be at least 1 second");
    } else if (config.refresh_interval > kMaxRefreshInterval) {
        result.add_error(ValidationError::InvalidRefreshInterval,
            "Refresh interval must not exceed 24 hours");
    } else if (config.refresh_interval >= kNominalTokenLifetime) {
        result.add_warning("Refresh interval is not shorter than the 10 minute token lifetime");
    }

    return result;
}

ValidationResult ConfigValidator::validate_http_config(const core::HttpConfig& config) {
    ValidationResult result;

    if (config.timeout < std::chrono::seconds{1} || config.timeout > kMaxTimeout) {
        result.add_error(ValidationError::InvalidTimeout,
            "HTTP timeout must be between 1 and 300 seconds");
    }
    if (!config.ca_cert.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(config.ca_cert, ec)) {
            result.add_error(ValidationError::InvalidCaCertificate,
                "CA bundle not found: " + config.ca_cert);
        }
    }
    if (!config.verify_ssl) {
        result.add_warning("TLS certificate verification is disabled");
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_auth_config(config.auth));
    result.merge(validate_token_config(config.token));
    result.merge(validate_http_config(config.http));

    return result;
}

} // namespace token_keeper::utils
