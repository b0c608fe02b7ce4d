#pragma once

#include <spdlog/common.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace CLI {
class App;
}

namespace devops_mcp {

/**
 * @brief Startup configuration for the stdio server
 *
 * Every field can be set on the command line or through an environment
 * variable (see add_options). Values are opaque to the protocol.
 */
struct ServerConfig {
    std::string cli_path = "./acme-devops-cli/devops-cli";
    std::string cli_working_directory;
    double query_timeout_seconds = 30.0;
    double promote_timeout_seconds = 300.0;
    std::size_t max_output_bytes = 1024 * 1024;
    std::string log_level = "info";
    bool show_version = false;

    /**
     * @brief Reject values the server cannot run with
     * @throws std::invalid_argument describing the first bad field
     */
    void validate() const;

    std::chrono::milliseconds query_timeout() const;
    std::chrono::milliseconds promote_timeout() const;
};

/**
 * @brief Register the server options (and their env fallbacks) on a CLI11 app
 */
void add_options(CLI::App& app, ServerConfig& config);

/**
 * @brief Map a textual level (trace, debug, info, warn, error, critical)
 * @throws std::invalid_argument for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace devops_mcp
