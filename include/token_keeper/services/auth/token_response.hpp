#pragma once

#include "token_keeper/core/models.hpp"
#include <expected>
#include <optional>
#include <string>

namespace token_keeper {
namespace services {

/**
 * @brief Decoders for the authorization server's JSON response body
 *
 * The two probes are independent: a body may carry a server error and a
 * usable token at the same time, and callers decide what to do with each.
 */
class TokenResponse {
public:
    /**
     * @brief Probe the body for an `{error, error_description}` payload
     *
     * @return The server error when the body is a JSON object with a
     *         non-empty `error` string, std::nullopt otherwise
     */
    static std::optional<core::ServerError> parse_server_error(const std::string& body);

    /**
     * @brief Decode the body as a token exchange result
     *
     * Requires a JSON object with non-empty string `access_token` and
     * `refresh_token` fields. `token_type` and `expires_in` are optional and
     * ignored when of the wrong type.
     *
     * @return The new token state or a description of why the shape is invalid
     */
    static std::expected<core::TokenState, std::string> parse_token_state(const std::string& body);
};

} // namespace services
} // namespace token_keeper
