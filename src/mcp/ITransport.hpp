#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief Outcome of a single read from a transport
 */
enum class ReadStatus {
    Message,     ///< A complete JSON value was read
    ParseError,  ///< Bytes were read but did not form a valid message
    Closed,      ///< End of input or transport closed
};

struct ReadResult {
    ReadStatus status = ReadStatus::Closed;
    json message;
    std::string error;
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages via different
 * transport protocols (stdio, HTTP/SSE, websockets, etc.)
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     *
     * Called from a single reader thread only. Malformed input is reported
     * as ReadStatus::ParseError; the transport stays usable afterwards.
     */
    virtual ReadResult read_message() = 0;

    /**
     * @brief Write one complete JSON-RPC message
     *
     * Safe to call from several threads; messages are never interleaved.
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Stop reading; wakes a reader blocked in read_message()
     *
     * Writes already in progress complete normally.
     */
    virtual void close() = 0;
};

} // namespace devops_mcp
