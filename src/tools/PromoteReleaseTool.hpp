#pragma once

#include "core/DevOpsCli.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace devops_mcp {

/**
 * @brief MCP tool promoting a release to the next environment
 *
 * Validation runs in a fixed order before anything is executed:
 *   1. app, version, from_env, to_env are trimmed and must be non-empty
 *   2. both environments are normalized against the whitelist
 *   3. from_env -> to_env must be one of dev->staging, staging->uat, uat->prod
 *
 * Promotions to prod are audited on the log at warning level before the
 * CLI is invoked. The CLI runs with the promote timeout; a timeout means
 * the deployment outcome is unknown, not that it did not happen.
 */
class PromoteReleaseTool {
public:
    explicit PromoteReleaseTool(std::shared_ptr<DevOpsCli> cli);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "app", "version", "from_env", "to_env"
     * @return {status, promotion{...}, production_deployment, timestamp}
     * @throws ValidationError, ExecutionError, CommandTimeoutError,
     *         DependencyUnavailableError
     */
    json execute(const json& args);

private:
    std::shared_ptr<DevOpsCli> cli_;
};

} // namespace devops_mcp
