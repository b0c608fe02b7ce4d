#include "DeploymentStatusTool.hpp"
#include "ToolSupport.hpp"
#include "core/Validation.hpp"

namespace devops_mcp {

DeploymentStatusTool::DeploymentStatusTool(std::shared_ptr<DevOpsCli> cli) : cli_(std::move(cli)) {
    if (!cli_) {
        throw std::invalid_argument("DevOps CLI cannot be null");
    }
}

ToolInfo DeploymentStatusTool::get_info() {
    return {
        "get_deployment_status",
        "Get deployment status across applications and environments, with optional filters",
        {
            {"type", "object"},
            {"properties", {
                {"application", {
                    {"type", "string"},
                    {"description", "Application filter, e.g. web-app"}
                }},
                {"environment", {
                    {"type", "string"},
                    {"description", "Environment filter (dev, staging, uat, prod)"}
                }}
            }}
        }
    };
}

json DeploymentStatusTool::execute(const json& args) {
    auto environment = Validator::normalize_environment(args::optional_string(args, "environment"));

    // A blank application filter means "all applications"
    std::string application = Validator::trim(args::optional_string(args, "application").value_or(""));

    std::vector<std::string> cli_args{"status", "--format", "json"};
    if (!application.empty()) {
        cli_args.push_back("--app");
        cli_args.push_back(application);
    }
    if (environment) {
        cli_args.push_back("--env");
        cli_args.push_back(*environment);
    }

    return cli_->run_query(cli_args, {"status", "deployments", "total_count", "filters_applied", "timestamp"});
}

} // namespace devops_mcp
