#pragma once

#include "core/DevOpsCli.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace devops_mcp {

/**
 * @brief MCP tool listing the release history of one application
 *
 * Read-only. Runs `releases --app <app> --format json [--limit N]` and
 * returns the CLI's JSON document unchanged.
 */
class ListReleasesTool {
public:
    explicit ListReleasesTool(std::shared_ptr<DevOpsCli> cli);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "app" and optional "limit"
     * @return Release document from the CLI
     * @throws ValidationError for an empty app or a limit below 1
     */
    json execute(const json& args);

private:
    std::shared_ptr<DevOpsCli> cli_;
};

} // namespace devops_mcp
