#include "FdInputBuffer.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace devops_mcp {

FdInputBuffer::FdInputBuffer(int fd) : fd_(fd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

FdInputBuffer::~FdInputBuffer() {
    ::close(wake_read_);
    ::close(wake_write_);
}

void FdInputBuffer::interrupt() {
    interrupted_ = true;
    const char byte = 1;
    // A full pipe already holds a wake-up byte, so EAGAIN is harmless
    if (::write(wake_write_, &byte, 1) < 0 && errno != EAGAIN) {
        spdlog::error("Failed to wake input reader: {}", std::strerror(errno));
    }
}

FdInputBuffer::int_type FdInputBuffer::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    for (;;) {
        if (interrupted_) {
            return traits_type::eof();
        }

        pollfd fds[2] = {
            {fd_, POLLIN, 0},
            {wake_read_, POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on input failed: {}", std::strerror(errno));
            return traits_type::eof();
        }

        if (fds[1].revents != 0) {
            return traits_type::eof();
        }
        if (fds[0].revents == 0) {
            continue;
        }

        ssize_t n = ::read(fd_, buffer_.data(), buffer_.size());
        if (n > 0) {
            setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
            return traits_type::to_int_type(*gptr());
        }
        if (n == 0) {
            return traits_type::eof();
        }
        if (errno != EINTR && errno != EAGAIN) {
            spdlog::error("read on input failed: {}", std::strerror(errno));
            return traits_type::eof();
        }
    }
}

} // namespace devops_mcp
