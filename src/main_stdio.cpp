#include "core/Config.hpp"
#include "core/DevOpsCli.hpp"
#include "core/ProcessRunner.hpp"
#include "mcp/FdInputBuffer.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/CheckHealthTool.hpp"
#include "tools/DeploymentStatusTool.hpp"
#include "tools/ListReleasesTool.hpp"
#include "tools/PingTool.hpp"
#include "tools/PromoteReleaseTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <thread>
#include <pthread.h>
#include <unistd.h>

namespace {

    /**
     * Waits for SIGINT/SIGTERM on a dedicated thread and asks the server to
     * stop. The signals must already be blocked in every thread.
     */
    class SignalWaiter {
    public:
        SignalWaiter(const sigset_t& signals, devops_mcp::MCPServer& server)
            : signals_(signals), server_(server), thread_([this] { loop(); }) {}

        ~SignalWaiter() {
            done_ = true;
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        SignalWaiter(const SignalWaiter&) = delete;
        SignalWaiter& operator=(const SignalWaiter&) = delete;

    private:
        void loop() {
            timespec tick{0, 200 * 1000 * 1000};
            while (!done_) {
                int signal = sigtimedwait(&signals_, nullptr, &tick);
                if (signal > 0) {
                    spdlog::info("Received signal {}, shutting down gracefully", signal);
                    server_.stop();
                    return;
                }
            }
        }

        sigset_t signals_;
        devops_mcp::MCPServer& server_;
        std::atomic<bool> done_{false};
        std::thread thread_;
    };

    void register_tools(devops_mcp::MCPServer& server, const std::shared_ptr<devops_mcp::DevOpsCli>& cli) {
        auto ping_tool = std::make_shared<devops_mcp::PingTool>();
        server.register_tool(
            devops_mcp::PingTool::get_info(),
            [ping_tool](const nlohmann::json& args) {
                return ping_tool->execute(args);
            }
        );

        auto status_tool = std::make_shared<devops_mcp::DeploymentStatusTool>(cli);
        server.register_tool(
            devops_mcp::DeploymentStatusTool::get_info(),
            [status_tool](const nlohmann::json& args) {
                return status_tool->execute(args);
            }
        );

        auto releases_tool = std::make_shared<devops_mcp::ListReleasesTool>(cli);
        server.register_tool(
            devops_mcp::ListReleasesTool::get_info(),
            [releases_tool](const nlohmann::json& args) {
                return releases_tool->execute(args);
            }
        );

        auto health_tool = std::make_shared<devops_mcp::CheckHealthTool>(cli);
        server.register_tool(
            devops_mcp::CheckHealthTool::get_info(),
            [health_tool](const nlohmann::json& args) {
                return health_tool->execute(args);
            }
        );

        auto promote_tool = std::make_shared<devops_mcp::PromoteReleaseTool>(cli);
        server.register_tool(
            devops_mcp::PromoteReleaseTool::get_info(),
            [promote_tool](const nlohmann::json& args) {
                return promote_tool->execute(args);
            }
        );
    }
}

int main(int argc, char** argv) {
    CLI::App app{"DevOps MCP Server - deployment tools over stdio"};

    devops_mcp::ServerConfig config;
    devops_mcp::add_options(app, config);

    CLI11_PARSE(app, argc, argv);

    if (config.show_version) {
        std::cout << "devops-mcp-server version 1.0.0" << std::endl;
        return 0;
    }

    // stdout carries protocol messages only; all logging goes to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("devops-mcp"));

    try {
        spdlog::set_level(devops_mcp::parse_log_level(config.log_level));
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting DevOps MCP Server");
    spdlog::info("Log level: {}", config.log_level);
    spdlog::info("DevOps CLI: {} (query timeout {}s, promote timeout {}s)", config.cli_path,
                 config.query_timeout_seconds, config.promote_timeout_seconds);

    // A closed client pipe must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    // Block before any thread is created so every thread inherits the mask
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    try {
        devops_mcp::FdInputBuffer input_buffer(STDIN_FILENO);
        std::istream input(&input_buffer);

        auto transport = std::make_unique<devops_mcp::StdioTransport>(
            input, std::cout, [&input_buffer]() { input_buffer.interrupt(); });
        auto server = std::make_unique<devops_mcp::MCPServer>(std::move(transport));

        devops_mcp::PosixProcessRunner::Options runner_options;
        runner_options.max_output_bytes = config.max_output_bytes;
        runner_options.working_directory = config.cli_working_directory;
        auto runner = std::make_shared<devops_mcp::PosixProcessRunner>(runner_options);

        devops_mcp::DevOpsCli::Options cli_options;
        cli_options.cli_path = config.cli_path;
        cli_options.query_timeout = config.query_timeout();
        cli_options.promote_timeout = config.promote_timeout();
        auto cli = std::make_shared<devops_mcp::DevOpsCli>(runner, cli_options);

        register_tools(*server, cli);
        spdlog::info("All tools registered, starting server");

        {
            SignalWaiter waiter(shutdown_signals, *server);
            server->run();
        }

        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
