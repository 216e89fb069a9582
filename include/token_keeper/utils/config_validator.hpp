#pragma once

#include "token_keeper/core/models.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace token_keeper::utils {

/**
 * @brief Configuration validation errors
 */
enum class ValidationError {
    InvalidUrl,
    MissingRequiredField,
    InvalidRefreshInterval,
    InvalidTimeout,
    InvalidCaCertificate
};

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid;
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }
};

class ConfigValidator {
public:
    static ValidationResult validate_auth_config(const core::AuthConfig& config);
    static ValidationResult validate_token_config(const core::TokenConfig& config);
    static ValidationResult validate_http_config(const core::HttpConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

    static constexpr std::chrono::seconds kNominalTokenLifetime{600};
    static constexpr std::chrono::seconds kMaxRefreshInterval{86400};
    static constexpr std::chrono::seconds kMaxTimeout{300};
};

} // namespace token_keeper::utils
