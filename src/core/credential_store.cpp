#include "token_keeper/core/credential_store.hpp"
#include "token_keeper/utils/logger.hpp"

namespace token_keeper {
namespace core {

CredentialStore::CredentialStore(Identity identity)
    : m_identity(std::move(identity)) {
    LOG_DEBUG("CredentialStore", "Initialized for user: " + m_identity.username);
}

std::string CredentialStore::current_access_token() const {
    std::shared_lock lock(m_mutex);
    return m_state ? m_state->access_token : std::string{};
}

std::string CredentialStore::current_refresh_token() const {
    std::shared_lock lock(m_mutex);
    return m_state ? m_state->refresh_token : std::string{};
}

std::optional<TokenState> CredentialStore::current_state() const {
    std::shared_lock lock(m_mutex);
    return m_state;
}

bool CredentialStore::has_token() const {
    std::shared_lock lock(m_mutex);
    return m_state.has_value();
}

void CredentialStore::replace_state(TokenState state) {
    std::unique_lock lock(m_mutex);
    m_state = std::move(state);
}

} // namespace core
} // namespace token_keeper
