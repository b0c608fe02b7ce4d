#include "core/DevOpsCli.hpp"
#include "core/ToolError.hpp"
#include "MockProcessRunner.hpp"
#include <gtest/gtest.h>

using namespace devops_mcp;
using namespace std::chrono_literals;

class DevOpsCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<MockProcessRunner>();
        DevOpsCli::Options options;
        options.cli_path = "/opt/acme/devops-cli";
        options.query_timeout = 30s;
        options.promote_timeout = 300s;
        cli = std::make_unique<DevOpsCli>(runner, options);
    }

    std::shared_ptr<MockProcessRunner> runner;
    std::unique_ptr<DevOpsCli> cli;
};

TEST_F(DevOpsCliTest, RunQueryParsesJson) {
    runner->push_success(R"({"releases": [{"version": "1.2.3"}]})");

    json data = cli->run_query({"releases", "--app", "web-api", "--format", "json"}, {"releases"});
    EXPECT_EQ(data["releases"][0]["version"], "1.2.3");

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1);
    std::vector<std::string> expected{"/opt/acme/devops-cli", "releases", "--app", "web-api", "--format", "json"};
    EXPECT_EQ(calls[0].argv, expected);
    EXPECT_EQ(calls[0].timeout, 30s);
}

TEST_F(DevOpsCliTest, NonZeroExitIsExecutionError) {
    runner->push_failure(2, "unknown application");

    try {
        cli->run_query({"releases", "--app", "nope"});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "DevOps CLI failed with exit code 2: unknown application");
        EXPECT_EQ(e.context()["exit_code"], 2);
        EXPECT_EQ(e.context()["stderr"], "unknown application");
    }
}

TEST_F(DevOpsCliTest, TimeoutIsCommandTimeoutError) {
    runner->push_timeout();

    try {
        cli->run_query({"health", "--format", "json"});
        FAIL() << "Expected CommandTimeoutError";
    } catch (const CommandTimeoutError& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("DevOps CLI timed out after 30 seconds.", 0), 0u);
        EXPECT_NE(message.find("unconfirmed"), std::string::npos);
        EXPECT_NE(message.find("check status out-of-band"), std::string::npos);
        EXPECT_EQ(e.kind(), ToolErrorKind::Timeout);
    }
}

TEST_F(DevOpsCliTest, SubSecondTimeoutIsReportedExactly) {
    DevOpsCli::Options options;
    options.cli_path = "/opt/acme/devops-cli";
    options.query_timeout = 300ms;
    DevOpsCli fast(runner, options);
    runner->push_timeout();

    try {
        fast.run_query({"status"});
        FAIL() << "Expected CommandTimeoutError";
    } catch (const CommandTimeoutError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("DevOps CLI timed out after 0.3 seconds.", 0), 0u);
    }
}

TEST(FormatSecondsTest, WholeAndFractional) {
    EXPECT_EQ(format_seconds(std::chrono::seconds(30)), "30");
    EXPECT_EQ(format_seconds(std::chrono::milliseconds(300)), "0.3");
    EXPECT_EQ(format_seconds(std::chrono::milliseconds(2500)), "2.5");
}

TEST_F(DevOpsCliTest, InvalidJsonIncludesRawOutput) {
    runner->push_success("not json at all");

    try {
        cli->run_query({"status"});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("CLI returned invalid JSON", 0), 0u);
        EXPECT_NE(message.find("not json at all"), std::string::npos);
    }
}

TEST_F(DevOpsCliTest, NonObjectJsonRejected) {
    runner->push_success("[1, 2, 3]");
    EXPECT_THROW(cli->run_query({"status"}), ExecutionError);
}

TEST_F(DevOpsCliTest, MissingRequiredFieldRejected) {
    runner->push_success(R"({"status": "ok"})");

    try {
        cli->run_query({"status"}, {"status", "deployments"});
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "CLI output missing required field: deployments");
    }
}

TEST_F(DevOpsCliTest, StderrOnSuccessIsNotAnError) {
    runner->push_success(R"({"health_checks": []})", "deprecated flag");
    EXPECT_NO_THROW(cli->run_query({"health"}, {"health_checks"}));
}

TEST_F(DevOpsCliTest, MissingCliNamesPath) {
    runner->fail_to_start();

    try {
        cli->run({"status"}, 30s);
        FAIL() << "Expected DependencyUnavailableError";
    } catch (const DependencyUnavailableError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("DevOps CLI tool not found at /opt/acme/devops-cli", 0), 0u);
        EXPECT_EQ(e.context()["cli_path"], "/opt/acme/devops-cli");
    }
}

TEST_F(DevOpsCliTest, RunReturnsFailuresAsData) {
    runner->push_failure(1, "boom");
    ExecutionResult result = cli->run({"promote", "a", "1", "dev", "staging"}, 300s);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code.value_or(-1), 1);
    EXPECT_EQ(runner->calls()[0].timeout, 300s);
}

TEST_F(DevOpsCliTest, RejectsInvalidConstruction) {
    EXPECT_THROW(DevOpsCli(nullptr, DevOpsCli::Options{}), std::invalid_argument);

    DevOpsCli::Options no_path;
    no_path.cli_path = "";
    EXPECT_THROW(DevOpsCli(runner, no_path), std::invalid_argument);
}
