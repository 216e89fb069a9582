#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace token_keeper::utils {

/**
 * @brief Helper utilities for safe JSON parsing and field extraction
 */
class JsonHelper {
public:
    /**
     * @brief Safely parse a JSON string
     *
     * @param json_string The JSON string to parse
     * @return std::expected<nlohmann::json, std::string> Parsed JSON or error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    /**
     * @brief Get a required field from JSON, returning error if missing
     *
     * @tparam T The expected type of the field
     * @param json The JSON object
     * @param field The field name
     * @return std::expected<T, std::string> The value or error message
     */
    template<typename T>
    static std::expected<T, std::string> get_required(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Get an optional field from JSON with a default value
     *
     * A field of the wrong type yields the default as well.
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    /**
     * @brief Check if a field exists and is not null
     */
    static bool has_field(const nlohmann::json& json, const std::string& field);
};

// Template implementations
template<typename T>
std::expected<T, std::string> JsonHelper::get_required(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object() || !json.contains(field)) {
        return std::unexpected("Missing required field: " + field);
    }

    try {
        return json.at(field).get<T>();
    } catch (const std::exception& e) {
        return std::unexpected("Failed to extract field '" + field + "': " + e.what());
    }
}

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    if (!has_field(json, field)) {
        return default_value;
    }

    try {
        return json.at(field).get<T>();
    } catch (const std::exception&) {
        return default_value;
    }
}

} // namespace token_keeper::utils
