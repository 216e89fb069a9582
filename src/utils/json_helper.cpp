#include "token_keeper/utils/json_helper.hpp"

namespace token_keeper::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    // Check if it starts with XML/HTML (common error response)
    if (json_string[0] == '<') {
        return std::unexpected("Response appears to be XML/HTML, not JSON");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        return std::unexpected("Error parsing JSON: " + std::string(e.what()));
    }
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json.at(field).is_null();
}

} // namespace token_keeper::utils
