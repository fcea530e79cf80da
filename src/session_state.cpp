#include "session_state.h"
#include <mutex>

namespace voice_relay {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Registering:   return "registering";
        case SessionState::Rejected:      return "rejected";
        case SessionState::Connecting:    return "connecting";
        case SessionState::Failed:        return "failed";
        case SessionState::Streaming:     return "streaming";
        case SessionState::Closing:       return "closing";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state == SessionState::Rejected ||
           state == SessionState::Failed ||
           state == SessionState::Closed;
}

class SessionStateMachine::Impl {
public:
    SessionState get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool transition(SessionState from, SessionState to) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != from) {
            return false;
        }
        state_ = to;
        return true;
    }

    bool begin_close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closing || is_terminal(state_)) {
            return false;
        }
        state_ = SessionState::Closing;
        return true;
    }

private:
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Uninitialized;
};

SessionStateMachine::SessionStateMachine() : pimpl_(std::make_unique<Impl>()) {}
SessionStateMachine::~SessionStateMachine() = default;

SessionState SessionStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool SessionStateMachine::begin_registration() {
    return pimpl_->transition(SessionState::Uninitialized, SessionState::Registering);
}

bool SessionStateMachine::on_admission(bool admitted) {
    return pimpl_->transition(SessionState::Registering,
                              admitted ? SessionState::Connecting : SessionState::Rejected);
}

bool SessionStateMachine::on_upstream_connected() {
    return pimpl_->transition(SessionState::Connecting, SessionState::Streaming);
}

bool SessionStateMachine::on_connect_failed() {
    return pimpl_->transition(SessionState::Connecting, SessionState::Failed);
}

bool SessionStateMachine::begin_close() {
    return pimpl_->begin_close();
}

bool SessionStateMachine::finish_close() {
    return pimpl_->transition(SessionState::Closing, SessionState::Closed);
}

} // namespace voice_relay
