#include "Session.hpp"
#include <spdlog/spdlog.h>

namespace devops_mcp {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::ShuttingDown:  return "shutting_down";
        case SessionState::Stopped:       return "stopped";
    }
    return "unknown";
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SessionState Session::begin_handshake(const std::string& protocol_version, const json& client_info) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionState observed = state_;
    if (observed == SessionState::Uninitialized) {
        state_ = SessionState::Initializing;
        protocol_version_ = protocol_version;
        client_info_ = client_info;
        spdlog::debug("Session state: uninitialized -> initializing");
    }
    return observed;
}

bool Session::complete_handshake() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Initializing) {
        return false;
    }
    state_ = SessionState::Ready;
    spdlog::debug("Session state: initializing -> ready");
    return true;
}

bool Session::begin_shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::ShuttingDown || state_ == SessionState::Stopped) {
        return false;
    }
    spdlog::debug("Session state: {} -> shutting_down", to_string(state_));
    state_ = SessionState::ShuttingDown;
    return true;
}

void Session::mark_stopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Stopped;
}

bool Session::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Ready;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

json Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

} // namespace devops_mcp
