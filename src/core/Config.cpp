#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <cmath>
#include <stdexcept>

namespace devops_mcp {

namespace {

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

} // namespace

void ServerConfig::validate() const {
    if (cli_path.empty()) {
        throw std::invalid_argument("cli-path cannot be empty");
    }
    if (!(query_timeout_seconds > 0.0)) {
        throw std::invalid_argument("query-timeout must be a positive number of seconds");
    }
    if (!(promote_timeout_seconds > 0.0)) {
        throw std::invalid_argument("promote-timeout must be a positive number of seconds");
    }
    if (max_output_bytes == 0) {
        throw std::invalid_argument("max-output-bytes must be greater than zero");
    }
    parse_log_level(log_level);
}

std::chrono::milliseconds ServerConfig::query_timeout() const {
    return to_millis(query_timeout_seconds);
}

std::chrono::milliseconds ServerConfig::promote_timeout() const {
    return to_millis(promote_timeout_seconds);
}

void add_options(CLI::App& app, ServerConfig& config) {
    app.add_option("--cli-path", config.cli_path, "Path or name of the DevOps CLI executable")
        ->envname("DEVOPS_CLI_PATH")
        ->capture_default_str();

    app.add_option("--cli-cwd", config.cli_working_directory, "Working directory for DevOps CLI invocations")
        ->envname("DEVOPS_CLI_CWD");

    app.add_option("--query-timeout", config.query_timeout_seconds, "Timeout in seconds for read-only CLI queries")
        ->envname("DEVOPS_MCP_QUERY_TIMEOUT")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--promote-timeout", config.promote_timeout_seconds, "Timeout in seconds for release promotions")
        ->envname("DEVOPS_MCP_PROMOTE_TIMEOUT")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--max-output-bytes", config.max_output_bytes, "Per-stream capture limit for CLI output")
        ->envname("DEVOPS_MCP_MAX_OUTPUT")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("-l,--log-level", config.log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->envname("DEVOPS_MCP_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}))
        ->capture_default_str();

    app.add_flag("-v,--version", config.show_version, "Print version information");
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

} // namespace devops_mcp
