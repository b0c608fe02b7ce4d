#include "PingTool.hpp"
#include "ToolSupport.hpp"
#include <spdlog/spdlog.h>

namespace devops_mcp {

ToolInfo PingTool::get_info() {
    return {
        "ping",
        "Test connectivity by echoing back a message prefixed with 'Pong: '",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "The message to echo back"}
                }}
            }},
            {"required", json::array({"message"})}
        }
    };
}

json PingTool::execute(const json& args) {
    std::string message = args::required_string(args, "message");
    spdlog::debug("Ping received: {}", message);
    return "Pong: " + message;
}

} // namespace devops_mcp
