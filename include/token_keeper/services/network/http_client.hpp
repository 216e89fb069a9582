#pragma once

#include "token_keeper/services/network/http_types.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace token_keeper {
namespace services {

// HTTP client interface
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;

    virtual std::expected<HttpResponse, NetworkError> post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers = {}) = 0;

    // URL-encodes the fields in order and posts them as a form body
    virtual std::expected<HttpResponse, NetworkError> post_form(
        const std::string& url,
        const FormFields& fields,
        const HttpHeaders& headers = {}) = 0;
};

// HTTP client configuration
struct HttpClientConfig {
    std::chrono::seconds default_timeout{30};
    std::chrono::seconds connect_timeout{10};
    std::string user_agent = "token-keeper/1.0";
    bool verify_ssl = true;

    std::optional<std::string> ca_cert_path;

    bool is_valid() const;
};

// Factory function for creating HTTP clients
std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

// Maps a libcurl CURLcode to the transport error reported to callers
NetworkError network_error_from_curl_code(int code);

} // namespace services
} // namespace token_keeper
