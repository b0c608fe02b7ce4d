#pragma once

#include "ProcessRunner.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief Gateway to the external DevOps CLI
 *
 * Prepends the configured CLI path to every argument vector and turns the
 * raw ExecutionResult into the error taxonomy used by the tools. Shared by
 * all tool instances; holds no per-call state.
 */
class DevOpsCli {
public:
    struct Options {
        std::string cli_path = "./acme-devops-cli/devops-cli";
        std::chrono::milliseconds query_timeout{30000};
        std::chrono::milliseconds promote_timeout{300000};
    };

    DevOpsCli(std::shared_ptr<IProcessRunner> runner, Options options);

    /**
     * @brief Run the CLI with the given arguments
     *
     * Non-zero exit and timeout are returned as data.
     *
     * @throws DependencyUnavailableError if the CLI cannot be started
     */
    ExecutionResult run(const std::vector<std::string>& args, std::chrono::milliseconds timeout);

    /**
     * @brief Run a read-only CLI command that prints a JSON object
     *
     * Uses the query timeout. Non-zero exit, timeout, unparseable output and
     * missing top-level fields are raised as ToolError subclasses.
     *
     * @param args CLI arguments (without the CLI path)
     * @param required_fields Top-level keys the output must contain
     * @return Parsed CLI output
     */
    json run_query(const std::vector<std::string>& args,
                   const std::vector<std::string>& required_fields = {});

    /**
     * @brief Full argument vector that would be executed for args
     */
    std::vector<std::string> command_line(const std::vector<std::string>& args) const;

    const std::string& cli_path() const { return options_.cli_path; }
    std::chrono::milliseconds query_timeout() const { return options_.query_timeout; }
    std::chrono::milliseconds promote_timeout() const { return options_.promote_timeout; }

private:
    std::shared_ptr<IProcessRunner> runner_;
    Options options_;
};

/**
 * @brief Timeout as seconds for messages: "30", "0.3", "2.5"
 */
std::string format_seconds(std::chrono::milliseconds duration);

} // namespace devops_mcp
