#pragma once

#include "core/DevOpsCli.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace devops_mcp {

/**
 * @brief MCP tool reporting environment health
 *
 * Read-only. Without "env" every environment is checked; the CLI returns
 * one health record per checked environment in "health_checks".
 */
class CheckHealthTool {
public:
    explicit CheckHealthTool(std::shared_ptr<DevOpsCli> cli);

    static ToolInfo get_info();

    json execute(const json& args);

private:
    std::shared_ptr<DevOpsCli> cli_;
};

} // namespace devops_mcp
