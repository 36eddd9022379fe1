#include "devagent/session.hpp"

namespace devagent {

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
    }
    return "unknown";
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::begin_initialize(std::string protocol_version,
                               std::optional<Implementation> client_info) {
    std::lock_guard<std::mutex> lock(mutex_);
    protocol_version_ = std::move(protocol_version);
    client_info_ = std::move(client_info);
    // A repeated initialize after ready keeps the session usable.
    if (state_ == SessionState::Uninitialized) {
        state_ = SessionState::Initializing;
    }
}

void Session::mark_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Ready;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

} // namespace devagent
