#include "token_keeper/services/auth/refresh_scheduler.hpp"
#include "token_keeper/core/credential_store.hpp"
#include "token_keeper/services/auth/auth_client.hpp"
#include "token_keeper/services/auth/token_persister.hpp"
#include "token_keeper/utils/logger.hpp"

namespace token_keeper {
namespace services {

std::string to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Running: return "running";
        case SchedulerState::Stopped: return "stopped";
        default: return "unknown";
    }
}

RefreshScheduler::RefreshScheduler(core::CredentialStore& store,
                                   AuthClient& auth_client,
                                   std::filesystem::path token_path,
                                   std::chrono::milliseconds interval)
    : m_store(store)
    , m_auth_client(auth_client)
    , m_token_path(std::move(token_path))
    , m_interval(interval) {
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

std::expected<void, SchedulerError> RefreshScheduler::start() {
    if (!m_store.has_token()) {
        LOG_ERROR("RefreshScheduler", "Cannot start before initial authentication succeeded");
        return std::unexpected(SchedulerError::NotAuthenticated);
    }

    auto expected_state = SchedulerState::Idle;
    if (!m_state.compare_exchange_strong(expected_state, SchedulerState::Running)) {
        LOG_WARNING("RefreshScheduler", "Start requested while " + to_string(expected_state));
        return std::unexpected(SchedulerError::AlreadyStarted);
    }

    LOG_INFO("RefreshScheduler", "Refreshing token every " +
             std::to_string(std::chrono::duration_cast<std::chrono::seconds>(m_interval).count()) + "s");
    m_thread = std::jthread([this](std::stop_token stop_token) { run_loop(stop_token); });
    return {};
}

void RefreshScheduler::stop() {
    if (!m_thread.joinable()) {
        return;
    }

    LOG_DEBUG("RefreshScheduler", "Stop requested");
    m_thread.request_stop();
    m_wait_cv.notify_all();
    m_thread.join();

    auto running = SchedulerState::Running;
    if (m_state.compare_exchange_strong(running, SchedulerState::Stopped)) {
        LOG_INFO("RefreshScheduler", "Stopped on request after " +
                 std::to_string(m_completed_refreshes.load()) + " refreshes");
    }
}

bool RefreshScheduler::tick() {
    std::lock_guard tick_lock(m_tick_mutex);

    if (m_state.load() != SchedulerState::Running) {
        LOG_DEBUG("RefreshScheduler", "Tick ignored while " + to_string(m_state.load()));
        return false;
    }

    auto refreshed = m_auth_client.refresh(m_store.identity(), m_store.current_refresh_token());
    if (!refreshed) {
        enter_stopped(refreshed.error(), "refresh");
        return false;
    }

    // The server invalidates the previous refresh token once a new pair is issued
    m_store.replace_state(refreshed.value());

    auto persisted = TokenPersister::persist(refreshed->access_token, m_token_path);
    if (!persisted) {
        enter_stopped(persisted.error(), "persist");
        return false;
    }

    ++m_completed_refreshes;
    LOG_DEBUG("RefreshScheduler", "Refresh #" + std::to_string(m_completed_refreshes.load()) + " complete");
    return true;
}

std::optional<core::AuthError> RefreshScheduler::last_error() const {
    std::lock_guard lock(m_error_mutex);
    return m_last_error;
}

void RefreshScheduler::run_loop(std::stop_token stop_token) {
    LOG_DEBUG("RefreshScheduler", "Refresh loop started");

    while (!stop_token.stop_requested()) {
        {
            std::unique_lock lock(m_wait_mutex);
            m_wait_cv.wait_for(lock, stop_token, m_interval, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }

        if (!tick()) {
            break;
        }
    }

    LOG_DEBUG("RefreshScheduler", "Refresh loop terminated");
}

void RefreshScheduler::enter_stopped(core::AuthError error, const std::string& step) {
    {
        std::lock_guard lock(m_error_mutex);
        m_last_error = error;
    }
    m_state.store(SchedulerState::Stopped);

    LOG_ERROR("RefreshScheduler", "Token " + step + " failed (" + core::to_string(error) +
              " for " + (step == "persist" ? m_token_path.string() : m_store.identity().endpoint_url) +
              "); scheduler stopped, restart required to resume");
}

} // namespace services
} // namespace token_keeper
