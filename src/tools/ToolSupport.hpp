#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace devops_mcp {

using json = nlohmann::json;

/**
 * @brief Typed access to tool arguments
 *
 * Type mismatches are reported as ValidationError naming the parameter, so
 * a wrong JSON type never surfaces as an internal error.
 */
namespace args {

/**
 * @brief Value of a string parameter; nullopt when absent or null
 */
std::optional<std::string> optional_string(const json& arguments, const std::string& name);

/**
 * @brief Value of a string parameter that must be present
 *
 * Absent or null values yield "" so the caller's non-empty check produces
 * the user-facing message.
 */
std::string required_string(const json& arguments, const std::string& name);

/**
 * @brief Integer parameter that must be >= 1 when present
 */
std::optional<long long> optional_positive_integer(const json& arguments, const std::string& name);

} // namespace args

/**
 * @brief Current UTC time as ISO-8601 with milliseconds, e.g. 2025-01-31T12:00:00.123Z
 */
std::string iso8601_utc_now();

} // namespace devops_mcp
