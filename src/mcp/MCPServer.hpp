#pragma once

#include "ITransport.hpp"
#include "Session.hpp"
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return JSON result; failures are thrown as ToolError subclasses
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Name and version reported in the initialize response
 */
struct ServerInfo {
    std::string name = "devops-mcp-server";
    std::string version = "1.0.0";
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles the initialize handshake, tool registration and request routing.
 * Supports methods: initialize, ping, tools/list, tools/call and the
 * notifications/initialized notification.
 *
 * Messages are read on the thread that calls run(). Each tools/call runs
 * as its own asynchronous task so a slow tool never delays unrelated
 * requests; responses go through the transport's serialized writer.
 */
class MCPServer {
public:
    /// Protocol version used when the client asks for one we do not know
    static constexpr const char* kDefaultProtocolVersion = "2024-11-05";

    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param info Identity reported during the handshake
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info = {});

    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Register a tool with handler
     *
     * Must be called before run().
     *
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport closes, then waits for
     * in-flight tool calls to finish and leaves the session STOPPED.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     *
     * Thread-safe. New requests are refused from now on; running tool calls
     * complete and their responses are still delivered.
     */
    void stop();

    SessionState state() const { return session_.state(); }

    /**
     * @brief Number of tool calls currently running
     */
    std::size_t in_flight() const;

private:
    void process_message(const json& message);
    void handle_notification(const std::string& method);
    void handle_initialize(const json& id, const json& params);
    json handle_tools_list();
    void handle_tools_call(const json& id, const json& params);
    json execute_tool(const json& id, const std::string& name, const ToolHandler& handler,
                      const json& arguments);

    /**
     * @brief Reject the request unless the session is READY
     * @return true if the request may proceed
     */
    bool require_ready(const json& id, const std::string& method);

    void launch(std::function<void()> task);
    void reap_finished();
    void wait_for_in_flight();

    void send(const json& message);

    json create_result_response(const json& id, const json& result);
    json create_error_response(const json& id, int code, const std::string& message,
                               const json& data = json());

    std::unique_ptr<ITransport> transport_;
    ServerInfo info_;
    Session session_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;

    mutable std::mutex tasks_mutex_;
    std::list<std::future<void>> tasks_;
};

} // namespace devops_mcp
