#include "mcp/FdInputBuffer.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <istream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace devops_mcp;

class FdInputBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }

    void write_input(const std::string& text) {
        ASSERT_EQ(::write(fds[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }

    void close_writer() {
        ::close(fds[1]);
        fds[1] = -1;
    }

    int fds[2] = {-1, -1};
};

TEST_F(FdInputBufferTest, ReadsLinesUntilEof) {
    FdInputBuffer buffer(fds[0]);
    std::istream in(&buffer);

    write_input("first\nsecond\n");
    close_writer();

    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "second");
    EXPECT_FALSE(std::getline(in, line));
}

TEST_F(FdInputBufferTest, InterruptWakesBlockedReader) {
    FdInputBuffer buffer(fds[0]);
    std::istream in(&buffer);

    std::thread waker([&buffer] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        buffer.interrupt();
    });

    // Nothing is ever written; only interrupt() can end this read
    std::string line;
    EXPECT_FALSE(std::getline(in, line));
    waker.join();
}

TEST_F(FdInputBufferTest, ReadsAfterInterruptReportEof) {
    FdInputBuffer buffer(fds[0]);
    std::istream in(&buffer);

    buffer.interrupt();
    write_input("ignored\n");

    std::string line;
    EXPECT_FALSE(std::getline(in, line));
}
