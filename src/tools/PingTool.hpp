#pragma once

#include "mcp/MCPServer.hpp"

namespace devops_mcp {

/**
 * @brief Connectivity check that echoes a message back as "Pong: <message>"
 *
 * Never touches the DevOps CLI.
 */
class PingTool {
public:
    static ToolInfo get_info();

    json execute(const json& args);
};

} // namespace devops_mcp
