#include "MCPServer.hpp"
#include "core/ToolError.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <set>
#include <stdexcept>

namespace devops_mcp {

namespace {

const std::set<std::string>& supported_protocol_versions() {
    static const std::set<std::string> kVersions{"2024-11-05", "2025-03-26", "2025-06-18"};
    return kVersions;
}

bool is_valid_id(const json& id) {
    return id.is_number_integer() || id.is_string();
}

std::string string_field(const json& object, const char* key, const std::string& fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info)
    : transport_(std::move(transport)), info_(std::move(info)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

MCPServer::~MCPServer() {
    wait_for_in_flight();
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (tools_.count(info.name) != 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::run() {
    spdlog::info("MCPServer starting main loop");

    while (transport_->is_open()) {
        SessionState current = session_.state();
        if (current == SessionState::ShuttingDown || current == SessionState::Stopped) {
            break;
        }

        ReadResult incoming = transport_->read_message();

        if (incoming.status == ReadStatus::Closed) {
            spdlog::info("Input closed, shutting down");
            break;
        }

        if (incoming.status == ReadStatus::ParseError) {
            send(create_error_response(json(), rpc_error::kParseError, "Parse error: " + incoming.error));
            continue;
        }

        try {
            process_message(incoming.message);
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            json id = incoming.message.is_object() ? incoming.message.value("id", json()) : json();
            send(create_error_response(is_valid_id(id) ? id : json(), rpc_error::kInternalError,
                                       std::string("Internal error: ") + e.what(), {{"kind", "internal"}}));
        }

        reap_finished();
    }

    session_.begin_shutdown();
    std::size_t pending = in_flight();
    if (pending > 0) {
        spdlog::info("Waiting for {} in-flight tool call(s) to finish", pending);
    }
    wait_for_in_flight();
    session_.mark_stopped();
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    if (session_.begin_shutdown()) {
        spdlog::info("MCPServer stop requested");
    }
    transport_->close();
}

std::size_t MCPServer::in_flight() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    std::size_t running = 0;
    for (const auto& task : tasks_) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++running;
        }
    }
    return running;
}

void MCPServer::process_message(const json& message) {
    if (!message.is_object()) {
        send(create_error_response(json(), rpc_error::kInvalidRequest,
                                   "Invalid Request: message must be a JSON object"));
        return;
    }

    const bool is_notification = !message.contains("id");
    json id = message.value("id", json());

    if (!is_notification && !is_valid_id(id)) {
        send(create_error_response(json(), rpc_error::kInvalidRequest,
                                   "Invalid Request: id must be an integer or a string"));
        return;
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (is_notification) {
            spdlog::warn("Dropping notification without jsonrpc 2.0 marker");
            return;
        }
        send(create_error_response(id, rpc_error::kInvalidRequest,
                                   "Invalid Request: missing or invalid jsonrpc field"));
        return;
    }

    if (!message.contains("method") || !message["method"].is_string() ||
        message["method"].get<std::string>().empty()) {
        if (!is_notification) {
            send(create_error_response(id, rpc_error::kInvalidRequest, "Invalid Request: missing method field"));
        }
        return;
    }

    std::string method = message["method"];
    json params = message.value("params", json::object());
    if (params.is_null()) {
        params = json::object();
    }

    if (is_notification) {
        handle_notification(method);
        return;
    }

    if (!params.is_object()) {
        send(create_error_response(id, rpc_error::kInvalidParams, "Invalid params: params must be an object"));
        return;
    }

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    if (method == "initialize") {
        handle_initialize(id, params);
    } else if (method == "ping") {
        send(create_result_response(id, json::object()));
    } else if (method == "tools/list") {
        if (require_ready(id, method)) {
            send(create_result_response(id, handle_tools_list()));
        }
    } else if (method == "tools/call") {
        if (require_ready(id, method)) {
            handle_tools_call(id, params);
        }
    } else {
        send(create_error_response(id, rpc_error::kMethodNotFound, "Method not found: " + method));
    }
}

void MCPServer::handle_notification(const std::string& method) {
    if (method == "notifications/initialized") {
        spdlog::info("Client sent initialized notification (session {})", to_string(session_.state()));
    } else if (method == "notifications/cancelled") {
        spdlog::info("Client cancelled a request; running tool calls are left to finish");
    } else {
        spdlog::debug("Ignoring notification: {}", method);
    }
}

bool MCPServer::require_ready(const json& id, const std::string& method) {
    SessionState current = session_.state();
    if (current == SessionState::Ready) {
        return true;
    }

    std::string message = current == SessionState::ShuttingDown || current == SessionState::Stopped
        ? "Server is shutting down, " + method + " rejected (session state: " + to_string(current) + ")"
        : "Server not initialized, " + method + " rejected (session state: " + to_string(current) + ")";
    spdlog::warn("{}", message);
    send(create_error_response(id, rpc_error::kInvalidRequest, message, {{"state", to_string(current)}}));
    return false;
}

void MCPServer::handle_initialize(const json& id, const json& params) {
    std::string requested = string_field(params, "protocolVersion", "");
    std::string negotiated = supported_protocol_versions().count(requested) != 0
        ? requested
        : kDefaultProtocolVersion;
    json client_info = params.value("clientInfo", json::object());

    SessionState previous = session_.begin_handshake(negotiated, client_info);
    if (previous != SessionState::Uninitialized) {
        std::string message = std::string("initialize is only valid once per session (session state: ") +
                              to_string(previous) + ")";
        spdlog::warn("{}", message);
        send(create_error_response(id, rpc_error::kInvalidRequest, message, {{"state", to_string(previous)}}));
        return;
    }

    spdlog::info("Client: {} version {}", string_field(client_info, "name", "unknown"),
                 string_field(client_info, "version", "unknown"));
    spdlog::info("Handshake: protocol version {} (client requested '{}')", negotiated, requested);

    send(create_result_response(id, {
        {"protocolVersion", negotiated},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    }));

    if (session_.complete_handshake()) {
        spdlog::info("Session ready (protocol {}, client {})", session_.protocol_version(),
                     string_field(session_.client_info(), "name", "unknown"));
    }
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

void MCPServer::handle_tools_call(const json& id, const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        send(create_error_response(id, rpc_error::kInvalidParams, "Missing required parameter: name"));
        return;
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }
    if (!arguments.is_object()) {
        send(create_error_response(id, rpc_error::kInvalidParams, "Invalid params: arguments must be an object"));
        return;
    }

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        send(create_error_response(id, rpc_error::kMethodNotFound, "Unknown tool: " + tool_name));
        return;
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    const ToolHandler& handler = handler_it->second;
    launch([this, id, tool_name, &handler, arguments]() {
        send(execute_tool(id, tool_name, handler, arguments));
    });
}

json MCPServer::execute_tool(const json& id, const std::string& name, const ToolHandler& handler,
                             const json& arguments) {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
            .count();
    };

    try {
        json result = handler(arguments);
        spdlog::debug("Tool {} finished in {}ms", name, elapsed_ms());
        std::string text = result.is_string()
            ? result.get<std::string>()
            : result.dump(-1, ' ', false, json::error_handler_t::replace);
        return create_result_response(id, {
            {"content", json::array({
                {
                    {"type", "text"},
                    {"text", text}
                }
            })}
        });
    } catch (const ToolError& e) {
        json data = e.context();
        data["kind"] = to_string(e.kind());
        data["tool"] = name;
        if (e.kind() == ToolErrorKind::Validation) {
            spdlog::warn("Tool {} rejected arguments {}: {}", name, arguments.dump(), e.what());
        } else {
            spdlog::error("Tool {} failed after {}ms ({}): {} | arguments={} context={}", name, elapsed_ms(),
                          to_string(e.kind()), e.what(), arguments.dump(),
                          e.context().dump(-1, ' ', false, json::error_handler_t::replace));
        }
        return create_error_response(id, e.rpc_code(), e.what(), data);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} raised an unexpected error after {}ms: {} | arguments={}", name, elapsed_ms(),
                      e.what(), arguments.dump());
        return create_error_response(id, rpc_error::kInternalError, std::string("Internal error: ") + e.what(),
                                     {{"kind", "internal"}, {"tool", name}});
    } catch (...) {
        spdlog::error("Tool {} raised a non-standard exception after {}ms", name, elapsed_ms());
        return create_error_response(id, rpc_error::kInternalError, "Internal error: unknown exception",
                                     {{"kind", "internal"}, {"tool", name}});
    }
}

void MCPServer::launch(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.push_back(std::async(std::launch::async, std::move(task)));
}

void MCPServer::reap_finished() {
    std::list<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.splice(finished.end(), tasks_, it++);
            } else {
                ++it;
            }
        }
    }

    for (auto& task : finished) {
        try {
            task.get();
        } catch (const std::exception& e) {
            spdlog::error("Tool task ended with an error: {}", e.what());
        }
    }
}

void MCPServer::wait_for_in_flight() {
    std::list<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        pending.swap(tasks_);
    }

    for (auto& task : pending) {
        try {
            task.get();
        } catch (const std::exception& e) {
            spdlog::error("Tool task ended with an error: {}", e.what());
        }
    }
}

void MCPServer::send(const json& message) {
    try {
        transport_->write_message(message);
    } catch (const std::exception& e) {
        spdlog::error("Failed to write response: {}", e.what());
    }
}

json MCPServer::create_result_response(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message, const json& data) {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

} // namespace devops_mcp
