#include "ToolError.hpp"

namespace devops_mcp {

const char* to_string(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::Validation:            return "validation";
        case ToolErrorKind::Execution:             return "execution";
        case ToolErrorKind::Timeout:               return "timeout";
        case ToolErrorKind::DependencyUnavailable: return "dependency_unavailable";
    }
    return "internal";
}

ToolError::ToolError(ToolErrorKind kind, const std::string& message, json context)
    : std::runtime_error(message), kind_(kind), context_(std::move(context)) {
    if (!context_.is_object()) {
        context_ = json::object();
    }
}

int ToolError::rpc_code() const noexcept {
    return kind_ == ToolErrorKind::Validation ? rpc_error::kInvalidParams
                                              : rpc_error::kInternalError;
}

ValidationError::ValidationError(const std::string& parameter, const std::string& message)
    : ToolError(ToolErrorKind::Validation, message, {{"parameter", parameter}}),
      parameter_(parameter) {}

ExecutionError::ExecutionError(const std::string& message, json context)
    : ToolError(ToolErrorKind::Execution, message, std::move(context)) {}

CommandTimeoutError::CommandTimeoutError(const std::string& message, json context)
    : ToolError(ToolErrorKind::Timeout, message, std::move(context)) {}

DependencyUnavailableError::DependencyUnavailableError(const std::string& message, json context)
    : ToolError(ToolErrorKind::DependencyUnavailable, message, std::move(context)) {}

} // namespace devops_mcp
