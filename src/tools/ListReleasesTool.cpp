#include "ListReleasesTool.hpp"
#include "ToolSupport.hpp"
#include "core/ToolError.hpp"
#include "core/Validation.hpp"
#include <spdlog/spdlog.h>

namespace devops_mcp {

ListReleasesTool::ListReleasesTool(std::shared_ptr<DevOpsCli> cli) : cli_(std::move(cli)) {
    if (!cli_) {
        throw std::invalid_argument("DevOps CLI cannot be null");
    }
}

ToolInfo ListReleasesTool::get_info() {
    return {
        "list_releases",
        "List release history for an application via the DevOps CLI",
        {
            {"type", "object"},
            {"properties", {
                {"app", {
                    {"type", "string"},
                    {"description", "Application name to query"}
                }},
                {"limit", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"description", "Maximum number of releases to return"}
                }}
            }},
            {"required", json::array({"app"})}
        }
    };
}

json ListReleasesTool::execute(const json& args) {
    auto raw_app = args::optional_string(args, "app");
    if (!raw_app) {
        spdlog::warn("Validation failed: parameter=app value=<missing>");
        throw ValidationError("app", "app parameter is required");
    }
    std::string app = Validator::trim_and_require_non_empty("app", *raw_app);
    auto limit = args::optional_positive_integer(args, "limit");

    std::vector<std::string> cli_args{"releases", "--app", app, "--format", "json"};
    if (limit) {
        cli_args.push_back("--limit");
        cli_args.push_back(std::to_string(*limit));
    }

    return cli_->run_query(cli_args, {"releases"});
}

} // namespace devops_mcp
