#include "PromoteReleaseTool.hpp"
#include "ToolSupport.hpp"
#include "core/ToolError.hpp"
#include "core/Validation.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace devops_mcp {

PromoteReleaseTool::PromoteReleaseTool(std::shared_ptr<DevOpsCli> cli) : cli_(std::move(cli)) {
    if (!cli_) {
        throw std::invalid_argument("DevOps CLI cannot be null");
    }
}

ToolInfo PromoteReleaseTool::get_info() {
    json environment = {
        {"type", "string"},
        {"enum", json::array({"dev", "staging", "uat", "prod"})}
    };
    json from_env = environment;
    from_env["description"] = "Source environment";
    json to_env = environment;
    to_env["description"] = "Target environment (must be the next one: dev->staging->uat->prod)";

    return {
        "promote_release",
        "Promote an application release to the next environment (dev->staging->uat->prod, no skipping or "
        "backward moves). Promotions to prod are audited.",
        {
            {"type", "object"},
            {"properties", {
                {"app", {{"type", "string"}, {"description", "Application name"}}},
                {"version", {{"type", "string"}, {"description", "Version identifier, e.g. 1.2.3"}}},
                {"from_env", from_env},
                {"to_env", to_env}
            }},
            {"required", json::array({"app", "version", "from_env", "to_env"})}
        }
    };
}

json PromoteReleaseTool::execute(const json& args) {
    const auto started = std::chrono::steady_clock::now();

    std::string app = Validator::trim_and_require_non_empty("app", args::required_string(args, "app"));
    std::string version = Validator::trim_and_require_non_empty("version", args::required_string(args, "version"));
    std::string from_env = Validator::trim_and_require_non_empty("from_env", args::required_string(args, "from_env"));
    std::string to_env = Validator::trim_and_require_non_empty("to_env", args::required_string(args, "to_env"));

    from_env = *Validator::normalize_environment(from_env, "from_env");
    to_env = *Validator::normalize_environment(to_env, "to_env");

    Validator::validate_promotion_path(from_env, to_env);

    const bool production = Validator::is_highest_risk(to_env);
    const std::string timestamp = iso8601_utc_now();

    if (production) {
        spdlog::warn("PRODUCTION DEPLOYMENT: Promoting {} v{} from {} to PRODUCTION", app, version, from_env);
        spdlog::warn("Production promotion audit trail: app={}, version={}, from={}, to={}, timestamp={}, caller=MCP",
                     app, version, from_env, to_env, timestamp);
    }

    const std::vector<std::string> cli_args{"promote", app, version, from_env, to_env};
    ExecutionResult result = cli_->run(cli_args, cli_->promote_timeout());

    const double execution_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    json context = {
        {"argv", cli_->command_line(cli_args)},
        {"app", app},
        {"version", version},
        {"from_env", from_env},
        {"to_env", to_env},
        {"execution_time_seconds", execution_time}
    };

    if (result.timed_out) {
        const std::string limit = format_seconds(cli_->promote_timeout());
        spdlog::error("Promotion timed out after {}s: {} v{} {}->{}", limit, app, version, from_env, to_env);
        throw CommandTimeoutError(
            "Promotion operation timed out after " + limit + " seconds. "
            "The deployment may still be in progress and its completion is unconfirmed. "
            "Check deployment status manually before retrying.",
            context);
    }

    if (!result.succeeded()) {
        context["exit_code"] = result.exit_code.value_or(-1);
        context["stderr"] = result.standard_error;
        context["stdout"] = result.standard_output;
        spdlog::error("Promotion failed: {}", result.standard_error);
        throw ExecutionError("Promotion failed: " + result.standard_error, context);
    }

    spdlog::info("Promoted {} v{} from {} to {} in {:.2f}s", app, version, from_env, to_env, execution_time);

    return {
        {"status", "success"},
        {"promotion", {
            {"app", app},
            {"version", version},
            {"from_env", from_env},
            {"to_env", to_env},
            {"cli_output", result.standard_output},
            {"cli_stderr", result.standard_error},
            {"execution_time_seconds", execution_time}
        }},
        {"production_deployment", production},
        {"timestamp", timestamp}
    };
}

} // namespace devops_mcp
