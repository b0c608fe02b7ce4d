#include "mcp/Session.hpp"
#include <gtest/gtest.h>

using namespace devops_mcp;

TEST(SessionTest, StartsUninitialized) {
    Session session;
    EXPECT_EQ(session.state(), SessionState::Uninitialized);
    EXPECT_FALSE(session.is_ready());
}

TEST(SessionTest, HandshakeReachesReady) {
    Session session;
    EXPECT_EQ(session.begin_handshake("2024-11-05", {{"name", "client"}}), SessionState::Uninitialized);
    EXPECT_EQ(session.state(), SessionState::Initializing);
    EXPECT_FALSE(session.is_ready());

    EXPECT_TRUE(session.complete_handshake());
    EXPECT_TRUE(session.is_ready());
    EXPECT_EQ(session.protocol_version(), "2024-11-05");
    EXPECT_EQ(session.client_info()["name"], "client");
}

TEST(SessionTest, SecondHandshakeReportsCurrentState) {
    Session session;
    session.begin_handshake("2024-11-05", json::object());
    session.complete_handshake();

    EXPECT_EQ(session.begin_handshake("2025-06-18", json::object()), SessionState::Ready);
    EXPECT_EQ(session.state(), SessionState::Ready);
    EXPECT_EQ(session.protocol_version(), "2024-11-05");
}

TEST(SessionTest, CompleteWithoutBeginFails) {
    Session session;
    EXPECT_FALSE(session.complete_handshake());
    EXPECT_EQ(session.state(), SessionState::Uninitialized);
}

TEST(SessionTest, ShutdownFromAnyState) {
    Session fresh;
    EXPECT_TRUE(fresh.begin_shutdown());
    EXPECT_EQ(fresh.state(), SessionState::ShuttingDown);
    EXPECT_FALSE(fresh.begin_shutdown());

    Session ready;
    ready.begin_handshake("2024-11-05", json::object());
    ready.complete_handshake();
    EXPECT_TRUE(ready.begin_shutdown());
    ready.mark_stopped();
    EXPECT_EQ(ready.state(), SessionState::Stopped);
    EXPECT_FALSE(ready.begin_shutdown());
}

TEST(SessionTest, HandshakeCannotCompleteAfterShutdown) {
    Session session;
    session.begin_handshake("2024-11-05", json::object());
    session.begin_shutdown();
    EXPECT_FALSE(session.complete_handshake());
    EXPECT_EQ(session.state(), SessionState::ShuttingDown);
}

TEST(SessionTest, StateNames) {
    EXPECT_STREQ(to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_STREQ(to_string(SessionState::Initializing), "initializing");
    EXPECT_STREQ(to_string(SessionState::Ready), "ready");
    EXPECT_STREQ(to_string(SessionState::ShuttingDown), "shutting_down");
    EXPECT_STREQ(to_string(SessionState::Stopped), "stopped");
}
