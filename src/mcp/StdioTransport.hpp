#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>

namespace devops_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited JSON, or LSP-style frames when a message starts
 * with a "Content-Length:" header. Replies use the framing of the most
 * recent request. Each message is written and flushed under a mutex.
 */
class StdioTransport : public ITransport {
public:
    /// Upper bound for a single message, in either framing
    static constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param on_close Called by close() to unblock a pending read (optional)
     * @param max_message_bytes Longer lines or frames are rejected as parse errors
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout,
                            std::function<void()> on_close = {},
                            std::size_t max_message_bytes = kMaxFrameBytes);

    ReadResult read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;
    void close() override;

private:
    enum class Framing { Line, ContentLength };

    ReadResult read_frame(const std::string& header_line);
    ReadResult parse_payload(const std::string& payload);
    ReadResult end_of_input();

    /**
     * @brief std::getline that stores at most max_message_bytes_ characters
     *
     * The rest of an oversized line is consumed and dropped; overflow is set.
     * @return false at end of input with nothing read
     */
    bool read_line(std::string& line, bool& overflow);

    std::istream& in_;
    std::ostream& out_;
    std::function<void()> on_close_;
    std::size_t max_message_bytes_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> eof_{false};
    std::atomic<Framing> framing_{Framing::Line};
};

} // namespace devops_mcp
