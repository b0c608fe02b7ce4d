#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the server
 */
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace rpc_error

/**
 * @brief Failure categories a tool handler can raise
 */
enum class ToolErrorKind {
    Validation,
    Execution,
    Timeout,
    DependencyUnavailable,
};

/**
 * @brief Stable string tag for an error kind ("validation", "timeout", ...)
 */
const char* to_string(ToolErrorKind kind);

/**
 * @brief Base class for every error a tool handler is allowed to throw
 *
 * Carries a kind and an optional JSON context object. The dispatcher
 * converts these into JSON-RPC error responses at a single boundary.
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorKind kind, const std::string& message, json context = json::object());

    ToolErrorKind kind() const noexcept { return kind_; }
    const json& context() const noexcept { return context_; }

    /**
     * @brief JSON-RPC error code for this error (-32602 or -32603)
     */
    int rpc_code() const noexcept;

private:
    ToolErrorKind kind_;
    json context_;
};

/**
 * @brief A parameter failed a validation rule; nothing was executed
 */
class ValidationError : public ToolError {
public:
    ValidationError(const std::string& parameter, const std::string& message);

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

/**
 * @brief The external command ran but reported failure or unusable output
 */
class ExecutionError : public ToolError {
public:
    explicit ExecutionError(const std::string& message, json context = json::object());
};

/**
 * @brief The external command did not finish in time; outcome is unknown
 */
class CommandTimeoutError : public ToolError {
public:
    explicit CommandTimeoutError(const std::string& message, json context = json::object());
};

/**
 * @brief The external command could not be located or started
 */
class DependencyUnavailableError : public ToolError {
public:
    explicit DependencyUnavailableError(const std::string& message, json context = json::object());
};

} // namespace devops_mcp
