#pragma once

#include <array>
#include <atomic>
#include <streambuf>

namespace devops_mcp {

/**
 * @brief Input stream buffer over a file descriptor that can be woken up
 *
 * Blocks in poll() on the descriptor and an internal wake pipe. Calling
 * interrupt() from any thread makes a pending or future read report end
 * of file, which lets the server leave a blocking std::getline on stdin
 * when shutdown is requested.
 */
class FdInputBuffer : public std::streambuf {
public:
    explicit FdInputBuffer(int fd);
    ~FdInputBuffer() override;

    FdInputBuffer(const FdInputBuffer&) = delete;
    FdInputBuffer& operator=(const FdInputBuffer&) = delete;

    /**
     * @brief Wake the reader; all further reads return EOF
     */
    void interrupt();

protected:
    int_type underflow() override;

private:
    int fd_;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic<bool> interrupted_{false};
    std::array<char, 64 * 1024> buffer_{};
};

} // namespace devops_mcp
