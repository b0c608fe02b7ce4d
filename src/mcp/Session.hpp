#pragma once

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief Lifecycle of a protocol session
 *
 * UNINITIALIZED -> INITIALIZING -> READY -> SHUTTING_DOWN -> STOPPED.
 * Shutdown may start from any state before STOPPED; STOPPED is terminal.
 */
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Stopped,
};

const char* to_string(SessionState state);

/**
 * @brief Thread-safe holder of the session lifecycle and handshake data
 */
class Session {
public:
    SessionState state() const;

    /**
     * @brief Move UNINITIALIZED -> INITIALIZING
     * @return State observed before the call; the handshake only started
     *         if this is SessionState::Uninitialized
     */
    SessionState begin_handshake(const std::string& protocol_version, const json& client_info);

    /**
     * @brief Move INITIALIZING -> READY (no-op from any other state)
     * @return true if the session became ready
     */
    bool complete_handshake();

    /**
     * @brief Move any live state to SHUTTING_DOWN
     * @return true if this call started the shutdown
     */
    bool begin_shutdown();

    /**
     * @brief Enter the terminal STOPPED state
     */
    void mark_stopped();

    bool is_ready() const;

    std::string protocol_version() const;
    json client_info() const;

private:
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Uninitialized;
    std::string protocol_version_;
    json client_info_ = json::object();
};

} // namespace devops_mcp
