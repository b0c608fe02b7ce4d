#include "CheckHealthTool.hpp"
#include "ToolSupport.hpp"
#include "core/Validation.hpp"

namespace devops_mcp {

CheckHealthTool::CheckHealthTool(std::shared_ptr<DevOpsCli> cli) : cli_(std::move(cli)) {
    if (!cli_) {
        throw std::invalid_argument("DevOps CLI cannot be null");
    }
}

ToolInfo CheckHealthTool::get_info() {
    return {
        "check_health",
        "Check environment health status via the DevOps CLI (all environments when env is omitted)",
        {
            {"type", "object"},
            {"properties", {
                {"env", {
                    {"type", "string"},
                    {"description", "Environment to check (dev, staging, uat, prod; case-insensitive)"}
                }}
            }}
        }
    };
}

json CheckHealthTool::execute(const json& args) {
    auto env = Validator::normalize_environment(args::optional_string(args, "env"), "env");

    std::vector<std::string> cli_args{"health", "--format", "json"};
    if (env) {
        cli_args.push_back("--env");
        cli_args.push_back(*env);
    }

    return cli_->run_query(cli_args, {"health_checks"});
}

} // namespace devops_mcp
