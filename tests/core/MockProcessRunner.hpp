#pragma once

#include "core/ProcessRunner.hpp"
#include "core/ToolError.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace devops_mcp {

/**
 * @brief Scripted IProcessRunner that records every invocation
 *
 * Results are returned in the order they were queued. An optional hook
 * runs inside execute() so tests can observe state at call time.
 */
class MockProcessRunner : public IProcessRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        std::chrono::milliseconds timeout{0};
    };

    ExecutionResult execute(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) override {
        std::function<void()> hook;
        ExecutionResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({argv, timeout});
            hook = on_execute_;
            if (results_.empty()) {
                throw std::logic_error("MockProcessRunner: no result queued");
            }
            result = results_.front();
            results_.pop_front();
        }
        if (hook) {
            hook();
        }
        if (fail_to_start_) {
            throw DependencyUnavailableError("Command '" + argv.front() + "' could not be started: No such file",
                                             json::object());
        }
        return result;
    }

    void push_result(ExecutionResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(std::move(result));
    }

    void push_success(const std::string& standard_output, const std::string& standard_error = "") {
        ExecutionResult result;
        result.standard_output = standard_output;
        result.standard_error = standard_error;
        result.exit_code = 0;
        push_result(result);
    }

    void push_failure(int exit_code, const std::string& standard_error) {
        ExecutionResult result;
        result.standard_error = standard_error;
        result.exit_code = exit_code;
        push_result(result);
    }

    void push_timeout() {
        ExecutionResult result;
        result.timed_out = true;
        push_result(result);
    }

    void fail_to_start() {
        fail_to_start_ = true;
        push_result({});
    }

    void on_execute(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_execute_ = std::move(hook);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<ExecutionResult> results_;
    std::vector<Call> calls_;
    std::function<void()> on_execute_;
    bool fail_to_start_ = false;
};

} // namespace devops_mcp
