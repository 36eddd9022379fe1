#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace devagent {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready
};

[[nodiscard]] const char* session_state_name(SessionState s);

/// Handshake state of the single connected client.
class Session {
public:
    Session() = default;

    SessionState state() const;

    /// Record the result of an initialize request.
    void begin_initialize(std::string protocol_version, std::optional<Implementation> client_info);

    /// Called on the initialized notification.
    void mark_ready();

    std::string protocol_version() const;
    std::optional<Implementation> client_info() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocol_version_;
    std::optional<Implementation> client_info_;
};

} // namespace devagent
