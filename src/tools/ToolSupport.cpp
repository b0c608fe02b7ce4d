#include "ToolSupport.hpp"
#include "core/ToolError.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace devops_mcp {

namespace args {

std::optional<std::string> optional_string(const json& arguments, const std::string& name) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return std::nullopt;
    }
    const json& value = arguments[name];
    if (!value.is_string()) {
        spdlog::warn("Validation failed: parameter={} value={}: not a string", name, value.dump());
        throw ValidationError(name, name + " must be a string");
    }
    return value.get<std::string>();
}

std::string required_string(const json& arguments, const std::string& name) {
    return optional_string(arguments, name).value_or(std::string());
}

std::optional<long long> optional_positive_integer(const json& arguments, const std::string& name) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return std::nullopt;
    }
    const json& value = arguments[name];
    if (!value.is_number_integer() || value.get<long long>() < 1) {
        spdlog::warn("Validation failed: parameter={} value={}", name, value.dump());
        throw ValidationError(name, name + " must be a positive integer");
    }
    return value.get<long long>();
}

} // namespace args

std::string iso8601_utc_now() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03lldZ", date, static_cast<long long>(millis));
    return stamp;
}

} // namespace devops_mcp
