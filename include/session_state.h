#pragma once

#include <memory>

namespace voice_relay {

/**
 * @brief Session lifecycle state
 */
enum class SessionState {
    Uninitialized,  ///< Created, no downstream attached yet
    Registering,    ///< Asking the connection registry for a slot
    Rejected,       ///< Registry at capacity (terminal)
    Connecting,     ///< Opening the upstream transport
    Failed,         ///< Upstream connect failed; resources released (terminal)
    Streaming,      ///< Sender and receiver loops running
    Closing,        ///< Cleanup in progress
    Closed          ///< Cleanup finished (terminal)
};

const char* session_state_name(SessionState state);

bool is_terminal(SessionState state);

/**
 * @brief Thread-safe session lifecycle state machine
 *
 * - Uninitialized -> Registering (begin_registration)
 * - Registering -> Connecting | Rejected (on_admission)
 * - Connecting -> Streaming (on_upstream_connected)
 * - Connecting -> Failed (on_connect_failed)
 * - any non-terminal state -> Closing (begin_close) -> Closed (finish_close)
 *
 * Every event returns whether it was applied; events that do not fit the
 * current state leave it unchanged. Message traffic is not an event.
 */
class SessionStateMachine {
public:
    SessionStateMachine();
    ~SessionStateMachine();

    SessionState get_state() const;

    bool begin_registration();
    bool on_admission(bool admitted);
    bool on_upstream_connected();
    bool on_connect_failed();

    /**
     * @brief Enter Closing
     * @return false if already closing or in a terminal state, so exactly one
     *         caller performs the teardown
     */
    bool begin_close();
    bool finish_close();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_relay
