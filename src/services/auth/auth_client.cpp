#include "token_keeper/services/auth/auth_client.hpp"
#include "token_keeper/services/auth/token_response.hpp"
#include "token_keeper/services/network/http_client.hpp"
#include "token_keeper/utils/logger.hpp"

namespace token_keeper {
namespace services {

namespace {
    core::AuthError classify_network_error(NetworkError error) {
        // curl reports body receive failures as BadResponse
        if (error == NetworkError::BadResponse) {
            return core::AuthError::ResponseReadError;
        }
        return core::AuthError::ConnectionError;
    }
}

AuthClient::AuthClient(std::shared_ptr<HttpClient> http_client)
    : m_http_client(std::move(http_client)) {
}

std::expected<core::TokenState, core::AuthError> AuthClient::authenticate(const core::Identity& identity) {
    LOG_DEBUG("AuthClient", "authenticate() called for user: " + identity.username);

    FormFields fields{
        {"grant_type", "password"},
        {"username", identity.username},
        {"password", identity.password},
        {"client_id", identity.client_id},
        {"client_secret", identity.client_secret},
        {"scope", identity.scope}
    };
    return exchange(identity, fields, "password");
}

std::expected<core::TokenState, core::AuthError> AuthClient::refresh(const core::Identity& identity,
                                                                     const std::string& refresh_token) {
    LOG_DEBUG("AuthClient", "refresh() called with refresh token length: " + std::to_string(refresh_token.length()));

    FormFields fields{
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token},
        {"client_id", identity.client_id},
        {"client_secret", identity.client_secret},
        {"scope", identity.scope}
    };
    return exchange(identity, fields, "refresh_token");
}

std::expected<core::TokenState, core::AuthError> AuthClient::exchange(const core::Identity& identity,
                                                                      const FormFields& fields,
                                                                      const std::string& grant) {
    const std::string& url = identity.endpoint_url;

    HttpHeaders headers{{"Accept", "application/json"}};
    auto response = m_http_client->post_form(url, fields, headers);
    if (!response) {
        auto error = classify_network_error(response.error());
        if (error == core::AuthError::ResponseReadError) {
            LOG_ERROR("AuthClient", "Server response error " + url + ": " + to_string(response.error()));
        } else {
            LOG_ERROR("AuthClient", "Could not connect to " + url + ": " + to_string(response.error()));
        }
        return std::unexpected(error);
    }

    LOG_DEBUG("AuthClient", grant + " grant answered with status " + std::to_string(response->status_code) +
              " (" + std::to_string(response->body.length()) + " bytes)");

    // Advisory only: a body flagged with an error may still carry a usable token
    if (auto server_error = TokenResponse::parse_server_error(response->body)) {
        LOG_WARNING("AuthClient", "Authorization server at " + url + " returned error (" +
                    core::to_string(core::AuthError::ServerDeclined) + "): " +
                    server_error->error + "(" + server_error->description + ")");
    }

    auto state = TokenResponse::parse_token_state(response->body);
    if (!state) {
        LOG_ERROR("AuthClient", "Authorization server at " + url + " returned malformed response (status " +
                  std::to_string(response->status_code) + "): " + state.error());
        return std::unexpected(core::AuthError::MalformedResponse);
    }

    LOG_INFO("AuthClient", "Obtained new access token via " + grant + " grant" +
             (state->expires_in ? ", expires in " + std::to_string(state->expires_in->count()) + "s" : std::string{}));
    return state.value();
}

} // namespace services
} // namespace token_keeper
