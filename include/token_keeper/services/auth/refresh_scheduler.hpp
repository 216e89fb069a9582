#pragma once

#include "token_keeper/core/models.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace token_keeper {
namespace core {
    class CredentialStore;
}
namespace services {

class AuthClient;

enum class SchedulerState {
    Idle,     // not started yet
    Running,
    Stopped   // terminal: a refresh or persist failed, or stop() was called
};

enum class SchedulerError {
    NotAuthenticated,
    AlreadyStarted
};

std::string to_string(SchedulerState state);

/**
 * @brief Fail-stop background refresh of the stored credential
 *
 * Every interval the scheduler exchanges the current refresh token for a new
 * pair, replaces the credential state and persists the access token. The
 * first failure of either step moves it to Stopped for good: no retry and no
 * restart. Ticks run strictly one after another.
 */
class RefreshScheduler {
public:
    RefreshScheduler(core::CredentialStore& store,
                     AuthClient& auth_client,
                     std::filesystem::path token_path,
                     std::chrono::milliseconds interval);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Refuses to start unless the store already holds a token
    std::expected<void, SchedulerError> start();

    // Cancels the background thread and waits for it to exit
    void stop();

    // Runs one refresh + persist cycle; returns false once Stopped
    bool tick();

    SchedulerState state() const { return m_state.load(); }
    std::size_t completed_refreshes() const { return m_completed_refreshes.load(); }
    std::optional<core::AuthError> last_error() const;
    std::chrono::milliseconds interval() const { return m_interval; }

private:
    void run_loop(std::stop_token stop_token);
    void enter_stopped(core::AuthError error, const std::string& step);

    core::CredentialStore& m_store;
    AuthClient& m_auth_client;
    const std::filesystem::path m_token_path;
    const std::chrono::milliseconds m_interval;

    std::atomic<SchedulerState> m_state{SchedulerState::Idle};
    std::atomic<std::size_t> m_completed_refreshes{0};

    mutable std::mutex m_error_mutex;
    std::optional<core::AuthError> m_last_error;

    std::mutex m_tick_mutex;
    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;
    std::jthread m_thread;
};

} // namespace services
} // namespace token_keeper
