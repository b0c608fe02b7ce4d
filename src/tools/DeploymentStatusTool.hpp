#pragma once

#include "core/DevOpsCli.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace devops_mcp {

/**
 * @brief MCP tool querying current deployments, optionally filtered
 */
class DeploymentStatusTool {
public:
    explicit DeploymentStatusTool(std::shared_ptr<DevOpsCli> cli);

    static ToolInfo get_info();

    json execute(const json& args);

private:
    std::shared_ptr<DevOpsCli> cli_;
};

} // namespace devops_mcp
