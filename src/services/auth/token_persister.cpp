#include "token_keeper/services/auth/token_persister.hpp"
#include "token_keeper/utils/logger.hpp"
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace token_keeper {
namespace services {

std::expected<void, core::AuthError> TokenPersister::persist(const std::string& access_token,
                                                             const std::filesystem::path& path) {
    if (path.empty()) {
        LOG_ERROR("TokenPersister", "No token file path configured");
        return std::unexpected(core::AuthError::IOError);
    }

    auto temp_path = path;
    temp_path += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("TokenPersister", "Failed to open token file for writing: " + temp_path.string());
            return std::unexpected(core::AuthError::IOError);
        }

        file.write(access_token.data(), static_cast<std::streamsize>(access_token.size()));
        file.flush();
        if (!file) {
            LOG_ERROR("TokenPersister", "Failed to write token file: " + temp_path.string());
            file.close();
            std::error_code remove_ec;
            std::filesystem::remove(temp_path, remove_ec);
            return std::unexpected(core::AuthError::IOError);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        LOG_ERROR("TokenPersister", "Failed to replace token file " + path.string() + ": " + ec.message());
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        return std::unexpected(core::AuthError::IOError);
    }

    LOG_DEBUG("TokenPersister", "Stored access token (" + std::to_string(access_token.length()) +
              " bytes) in " + path.string());
    return {};
}

} // namespace services
} // namespace token_keeper
