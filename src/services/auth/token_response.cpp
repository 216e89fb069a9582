#include "token_keeper/services/auth/token_response.hpp"
#include "token_keeper/utils/json_helper.hpp"
#include <cstdint>

namespace token_keeper {
namespace services {

std::optional<core::ServerError> TokenResponse::parse_server_error(const std::string& body) {
    auto json_result = utils::JsonHelper::safe_parse(body);
    if (!json_result || !json_result->is_object()) {
        return std::nullopt;
    }

    core::ServerError server_error{
        .error = utils::JsonHelper::get_optional<std::string>(*json_result, "error", ""),
        .description = utils::JsonHelper::get_optional<std::string>(*json_result, "error_description", "")
    };

    if (server_error.empty()) {
        return std::nullopt;
    }
    return server_error;
}

std::expected<core::TokenState, std::string> TokenResponse::parse_token_state(const std::string& body) {
    auto json_result = utils::JsonHelper::safe_parse(body);
    if (!json_result) {
        return std::unexpected(json_result.error());
    }

    const auto& json = json_result.value();
    if (!json.is_object()) {
        return std::unexpected("Response is not a JSON object");
    }

    auto access_token = utils::JsonHelper::get_required<std::string>(json, "access_token");
    if (!access_token) {
        return std::unexpected(access_token.error());
    }
    if (access_token->empty()) {
        return std::unexpected("Field 'access_token' is empty");
    }

    auto refresh_token = utils::JsonHelper::get_required<std::string>(json, "refresh_token");
    if (!refresh_token) {
        return std::unexpected(refresh_token.error());
    }
    if (refresh_token->empty()) {
        return std::unexpected("Field 'refresh_token' is empty");
    }

    core::TokenState state;
    state.access_token = std::move(access_token.value());
    state.refresh_token = std::move(refresh_token.value());
    state.token_type = utils::JsonHelper::get_optional<std::string>(json, "token_type", "");

    if (utils::JsonHelper::has_field(json, "expires_in") && json.at("expires_in").is_number_integer()) {
        state.expires_in = std::chrono::seconds{json.at("expires_in").get<std::int64_t>()};
    }

    return state;
}

} // namespace services
} // namespace token_keeper
