#pragma once

#include "token_keeper/core/models.hpp"
#include <optional>
#include <shared_mutex>
#include <string>

namespace token_keeper {
namespace core {

/**
 * @brief Owns the account identity and the latest token state
 *
 * The identity is fixed at construction. The token state is only ever
 * replaced as a whole value, so readers never observe a mix of two
 * exchanges.
 */
class CredentialStore {
public:
    explicit CredentialStore(Identity identity);
    ~CredentialStore() = default;

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    const Identity& identity() const { return m_identity; }

    std::string current_access_token() const;
    std::string current_refresh_token() const;
    std::optional<TokenState> current_state() const;
    bool has_token() const;

    void replace_state(TokenState state);

private:
    const Identity m_identity;

    mutable std::shared_mutex m_mutex;
    std::optional<TokenState> m_state;
};

} // namespace core
} // namespace token_keeper
