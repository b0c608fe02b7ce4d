#include "core/Config.hpp"
#include <CLI/CLI.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>

using namespace devops_mcp;
using namespace std::chrono_literals;

namespace {

void parse(CLI::App& app, std::vector<std::string> args) {
    // CLI11 consumes the vector in reverse order
    std::reverse(args.begin(), args.end());
    app.parse(args);
}

} // namespace

TEST(ConfigTest, Defaults) {
    ServerConfig config;
    CLI::App app;
    add_options(app, config);
    parse(app, {});

    EXPECT_EQ(config.cli_path, "./acme-devops-cli/devops-cli");
    EXPECT_EQ(config.query_timeout(), 30s);
    EXPECT_EQ(config.promote_timeout(), 300s);
    EXPECT_EQ(config.max_output_bytes, 1024u * 1024u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, CommandLineOptions) {
    ServerConfig config;
    CLI::App app;
    add_options(app, config);
    parse(app, {"--cli-path", "/usr/local/bin/devops", "--query-timeout", "2.5", "--promote-timeout", "60",
                "--max-output-bytes", "4096", "-l", "debug", "--cli-cwd", "/srv"});

    EXPECT_EQ(config.cli_path, "/usr/local/bin/devops");
    EXPECT_EQ(config.cli_working_directory, "/srv");
    EXPECT_EQ(config.query_timeout(), 2500ms);
    EXPECT_EQ(config.promote_timeout(), 60s);
    EXPECT_EQ(config.max_output_bytes, 4096u);
    EXPECT_EQ(parse_log_level(config.log_level), spdlog::level::debug);
}

TEST(ConfigTest, EnvironmentFallback) {
    ::setenv("DEVOPS_CLI_PATH", "/env/devops-cli", 1);
    ::setenv("DEVOPS_MCP_QUERY_TIMEOUT", "5", 1);

    ServerConfig config;
    CLI::App app;
    add_options(app, config);
    parse(app, {});

    ::unsetenv("DEVOPS_CLI_PATH");
    ::unsetenv("DEVOPS_MCP_QUERY_TIMEOUT");

    EXPECT_EQ(config.cli_path, "/env/devops-cli");
    EXPECT_EQ(config.query_timeout(), 5s);
}

TEST(ConfigTest, RejectsInvalidValues) {
    {
        ServerConfig config;
        CLI::App app;
        add_options(app, config);
        EXPECT_THROW(parse(app, {"--query-timeout", "-1"}), CLI::ValidationError);
    }
    {
        ServerConfig config;
        CLI::App app;
        add_options(app, config);
        EXPECT_THROW(parse(app, {"--log-level", "verbose"}), CLI::ValidationError);
    }

    ServerConfig empty_path;
    empty_path.cli_path = "";
    EXPECT_THROW(empty_path.validate(), std::invalid_argument);

    ServerConfig zero_timeout;
    zero_timeout.promote_timeout_seconds = 0;
    EXPECT_THROW(zero_timeout.validate(), std::invalid_argument);
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
}
