#include "core/ToolError.hpp"
#include <gtest/gtest.h>

using namespace devops_mcp;

TEST(ToolErrorTest, KindsMapToRpcCodes) {
    EXPECT_EQ(ValidationError("app", "app cannot be empty").rpc_code(), -32602);
    EXPECT_EQ(ExecutionError("failed").rpc_code(), -32603);
    EXPECT_EQ(CommandTimeoutError("timed out").rpc_code(), -32603);
    EXPECT_EQ(DependencyUnavailableError("missing").rpc_code(), -32603);
}

TEST(ToolErrorTest, KindNames) {
    EXPECT_STREQ(to_string(ToolErrorKind::Validation), "validation");
    EXPECT_STREQ(to_string(ToolErrorKind::Execution), "execution");
    EXPECT_STREQ(to_string(ToolErrorKind::Timeout), "timeout");
    EXPECT_STREQ(to_string(ToolErrorKind::DependencyUnavailable), "dependency_unavailable");
}

TEST(ToolErrorTest, CarriesContext) {
    ExecutionError error("DevOps CLI failed with exit code 2: boom", {{"exit_code", 2}});
    EXPECT_EQ(error.kind(), ToolErrorKind::Execution);
    EXPECT_EQ(error.context()["exit_code"], 2);

    // Subclasses are catchable through the common base
    try {
        throw CommandTimeoutError("timed out", {{"elapsed_ms", 30000}});
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ToolErrorKind::Timeout);
        EXPECT_EQ(std::string(e.what()), "timed out");
    }
}
