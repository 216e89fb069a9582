#pragma once

#include "token_keeper/core/models.hpp"
#include "token_keeper/services/network/http_types.hpp"
#include <expected>
#include <memory>
#include <string>

namespace token_keeper {
namespace services {

class HttpClient;

/**
 * @brief Performs the OAuth2 token exchanges against the authorization endpoint
 *
 * Both grants post a form body and share one response protocol: transport
 * failures are returned immediately, a server `error` field is reported but
 * does not stop the body from being decoded as a token, and only a body
 * without a valid token shape fails the exchange.
 */
class AuthClient {
public:
    explicit AuthClient(std::shared_ptr<HttpClient> http_client);
    ~AuthClient() = default;

    // Password grant: exchange username and password for a token pair
    std::expected<core::TokenState, core::AuthError> authenticate(const core::Identity& identity);

    // Refresh grant: exchange the current refresh token for a new pair
    std::expected<core::TokenState, core::AuthError> refresh(const core::Identity& identity,
                                                             const std::string& refresh_token);

private:
    std::expected<core::TokenState, core::AuthError> exchange(const core::Identity& identity,
                                                              const FormFields& fields,
                                                              const std::string& grant);

    std::shared_ptr<HttpClient> m_http_client;
};

} // namespace services
} // namespace token_keeper
