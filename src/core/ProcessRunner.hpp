#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace devops_mcp {

/**
 * @brief Outcome of one external command invocation
 *
 * exit_code is empty when the command was killed because it exceeded its
 * timeout; timed_out is then true. A non-zero exit code is data, not an
 * error: callers decide what it means.
 */
struct ExecutionResult {
    std::string standard_output;
    std::string standard_error;
    std::optional<int> exit_code;
    bool timed_out = false;
    std::chrono::milliseconds duration{0};
    bool output_truncated = false;
    bool error_truncated = false;

    bool succeeded() const { return !timed_out && exit_code && *exit_code == 0; }
};

/**
 * @brief Abstract interface for launching external commands
 *
 * Implementations must pass argv as discrete arguments (never through a
 * shell) and must not return before the child is terminated and reaped.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a command and capture its output
     * @param argv Program name (looked up in PATH) followed by its arguments
     * @param timeout Wall-clock limit; the process group is killed when exceeded
     * @return Captured output, exit code or timed-out marker, duration
     * @throws DependencyUnavailableError if the program cannot be started
     */
    virtual ExecutionResult execute(const std::vector<std::string>& argv,
                                    std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief IProcessRunner backed by posix_spawnp and poll()
 *
 * The child gets /dev/null as stdin, its own process group, default signal
 * dispositions and an empty signal mask. stdout/stderr are captured up to
 * max_output_bytes each; anything beyond is drained and discarded.
 */
class PosixProcessRunner : public IProcessRunner {
public:
    struct Options {
        std::size_t max_output_bytes = 1024 * 1024;
        std::string working_directory;  // empty = inherit
    };

    PosixProcessRunner();
    explicit PosixProcessRunner(Options options);

    ExecutionResult execute(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) override;

private:
    Options options_;
};

} // namespace devops_mcp
