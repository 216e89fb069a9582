#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace token_keeper {
namespace services {

// Network error types
enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse,   // the response body could not be received
    Cancelled
};

inline std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timeout";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::TooManyRedirects: return "too many redirects";
        case NetworkError::BadResponse: return "bad response";
        case NetworkError::Cancelled: return "cancelled";
        default: return "unknown network error";
    }
}

// HTTP headers type
using HttpHeaders = std::unordered_map<std::string, std::string>;

// Ordered form fields for application/x-www-form-urlencoded bodies
using FormFields = std::vector<std::pair<std::string, std::string>>;

// POST request structure
struct HttpRequest {
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::seconds timeout{30};
    bool verify_ssl = true;

    bool is_valid() const;
};

// HTTP response structure
struct HttpResponse {
    int status_code = 0;
    std::string body;
};

} // namespace services
} // namespace token_keeper
