#pragma once

#include "token_keeper/core/models.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace token_keeper {
namespace services {

// Publishes the current access token for other local processes.
class TokenPersister {
public:
    /**
     * @brief Replace the file at @p path with the raw access token bytes
     *
     * The token is written to a sibling temporary file which is then renamed
     * over the target, so readers see either the previous token or the new
     * one. Nothing else (no newline, no refresh token) is written.
     */
    static std::expected<void, core::AuthError> persist(const std::string& access_token,
                                                        const std::filesystem::path& path);
};

} // namespace services
} // namespace token_keeper
