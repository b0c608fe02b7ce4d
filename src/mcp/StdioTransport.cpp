#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace devops_mcp {

namespace {

constexpr const char* kContentLengthHeader = "content-length:";

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool starts_with_ignore_case(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::function<void()> on_close,
                               std::size_t max_message_bytes)
    : in_(in), out_(out), on_close_(std::move(on_close)), max_message_bytes_(max_message_bytes) {
    spdlog::debug("StdioTransport initialized");
}

bool StdioTransport::read_line(std::string& line, bool& overflow) {
    line.clear();
    overflow = false;

    bool read_any = false;
    char c = 0;
    while (in_.get(c)) {
        read_any = true;
        if (c == '\n') {
            return true;
        }
        if (line.size() >= max_message_bytes_) {
            overflow = true;
            continue;
        }
        line.push_back(c);
    }
    return read_any;
}

ReadResult StdioTransport::end_of_input() {
    eof_ = true;
    return {ReadStatus::Closed, json(), {}};
}

ReadResult StdioTransport::read_message() {
    std::string line;
    bool overflow = false;

    while (!closed_) {
        if (!read_line(line, overflow)) {
            if (closed_) {
                spdlog::debug("Input reader interrupted by close()");
            } else if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
            } else {
                spdlog::error("Error reading from input stream");
            }
            return end_of_input();
        }

        if (overflow) {
            spdlog::error("Message line exceeds {} bytes, discarded", max_message_bytes_);
            return {ReadStatus::ParseError, json(),
                    "message exceeds " + std::to_string(max_message_bytes_) + " bytes"};
        }

        strip_carriage_return(line);
        if (is_blank(line)) {
            continue;
        }

        if (starts_with_ignore_case(line, kContentLengthHeader)) {
            return read_frame(line);
        }

        framing_ = Framing::Line;
        return parse_payload(line);
    }
    return end_of_input();
}

ReadResult StdioTransport::read_frame(const std::string& header_line) {
    std::string value = header_line.substr(std::string(kContentLengthHeader).size());
    std::size_t length = 0;
    bool valid_length = false;
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        valid_length = is_blank(value.substr(consumed)) && parsed <= max_message_bytes_;
        length = static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        valid_length = false;
    }

    // Skip remaining headers (e.g. Content-Type) up to the blank separator line
    std::string line;
    bool overflow = false;
    for (;;) {
        if (!read_line(line, overflow)) {
            spdlog::error("Input ended inside a frame header");
            eof_ = true;
            return {ReadStatus::ParseError, json(), "truncated frame header"};
        }
        strip_carriage_return(line);
        if (line.empty()) {
            break;
        }
    }

    if (!valid_length) {
        spdlog::error("Invalid Content-Length header: '{}'", header_line);
        return {ReadStatus::ParseError, json(), "invalid Content-Length header"};
    }

    std::string body(length, '\0');
    in_.read(&body[0], static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in_.gcount()) != length) {
        spdlog::error("Frame truncated: expected {} bytes, got {}", length, in_.gcount());
        eof_ = true;
        return {ReadStatus::ParseError, json(), "truncated frame body"};
    }

    framing_ = Framing::ContentLength;
    return parse_payload(body);
}

ReadResult StdioTransport::parse_payload(const std::string& payload) {
    try {
        json message = json::parse(payload);
        spdlog::debug("Read message: {}", payload);
        return {ReadStatus::Message, std::move(message), {}};
    } catch (const json::parse_error& e) {
        spdlog::error("JSON parse error: {}", e.what());
        return {ReadStatus::ParseError, json(), e.what()};
    }
}

void StdioTransport::write_message(const json& message) {
    // Subprocess output may carry invalid UTF-8; replace it instead of failing the write
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (framing_ == Framing::ContentLength) {
        out_ << "Content-Length: " << serialized.size() << "\r\n\r\n" << serialized;
    } else {
        out_ << serialized << '\n';
    }
    out_.flush();
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !closed_ && !eof_;
}

void StdioTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    spdlog::debug("StdioTransport closing");
    if (on_close_) {
        on_close_();
    }
}

} // namespace devops_mcp
