#include "DevOpsCli.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace devops_mcp {

namespace {

std::string join_args(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

} // namespace

std::string format_seconds(std::chrono::milliseconds duration) {
    if (duration.count() % 1000 == 0) {
        return std::to_string(duration.count() / 1000);
    }
    return fmt::format("{:g}", static_cast<double>(duration.count()) / 1000.0);
}

DevOpsCli::DevOpsCli(std::shared_ptr<IProcessRunner> runner, Options options)
    : runner_(std::move(runner)), options_(std::move(options)) {
    if (!runner_) {
        throw std::invalid_argument("Process runner cannot be null");
    }
    if (options_.cli_path.empty()) {
        throw std::invalid_argument("DevOps CLI path cannot be empty");
    }
}

std::vector<std::string> DevOpsCli::command_line(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.cli_path);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

ExecutionResult DevOpsCli::run(const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
    auto argv = command_line(args);
    spdlog::info("Executing DevOps CLI: {}", join_args(args));

    ExecutionResult result;
    try {
        result = runner_->execute(argv, timeout);
    } catch (const DependencyUnavailableError& e) {
        spdlog::error("DevOps CLI not available at {}: {}", options_.cli_path, e.what());
        throw DependencyUnavailableError("DevOps CLI tool not found at " + options_.cli_path + ": " + e.what(),
                                         {{"cli_path", options_.cli_path}, {"argv", argv}});
    }

    if (result.timed_out) {
        spdlog::error("DevOps CLI timed out after {}s: {}", format_seconds(timeout), join_args(args));
    } else {
        spdlog::debug("DevOps CLI completed in {}ms with exit code {}", result.duration.count(),
                      result.exit_code.value_or(-1));
    }
    return result;
}

json DevOpsCli::run_query(const std::vector<std::string>& args,
                          const std::vector<std::string>& required_fields) {
    auto result = run(args, options_.query_timeout);
    json context = {{"argv", command_line(args)}, {"elapsed_ms", result.duration.count()}};

    if (result.timed_out) {
        throw CommandTimeoutError("DevOps CLI timed out after " + format_seconds(options_.query_timeout) +
                                      " seconds. Completion is unconfirmed; check status out-of-band "
                                      "before relying on or retrying this request.",
                                  context);
    }

    if (!result.succeeded()) {
        int code = result.exit_code.value_or(-1);
        context["exit_code"] = code;
        context["stderr"] = result.standard_error;
        spdlog::error("DevOps CLI failed with exit code {}: {}", code, result.standard_error);
        throw ExecutionError("DevOps CLI failed with exit code " + std::to_string(code) + ": " +
                                 result.standard_error,
                             context);
    }

    json data;
    try {
        data = json::parse(result.standard_output);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse CLI output as JSON: {}", e.what());
        spdlog::debug("Raw CLI output: {}", result.standard_output);
        context["raw_output"] = result.standard_output;
        throw ExecutionError(std::string("CLI returned invalid JSON: ") + e.what() +
                                 "; raw output: " + result.standard_output,
                             context);
    }

    if (!data.is_object()) {
        context["raw_output"] = result.standard_output;
        throw ExecutionError("CLI returned JSON that is not an object; raw output: " + result.standard_output,
                             context);
    }

    for (const auto& field : required_fields) {
        if (!data.contains(field)) {
            context["raw_output"] = result.standard_output;
            throw ExecutionError("CLI output missing required field: " + field, context);
        }
    }

    if (!result.standard_error.empty()) {
        spdlog::warn("CLI stderr: {}", result.standard_error);
    }
    return data;
}

} // namespace devops_mcp
