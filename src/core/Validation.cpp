#include "Validation.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace devops_mcp {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join_sorted(const std::set<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {  // std::set iterates in sorted order
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

[[noreturn]] void reject(const std::string& parameter, const std::string& value,
                         const std::string& message) {
    spdlog::warn("Validation failed: parameter={} value='{}': {}", parameter, value, message);
    throw ValidationError(parameter, message);
}

} // namespace

const std::set<std::string>& Validator::environments() {
    static const std::set<std::string> kEnvironments{"dev", "staging", "uat", "prod"};
    return kEnvironments;
}

const std::set<std::pair<std::string, std::string>>& Validator::promotion_edges() {
    static const std::set<std::pair<std::string, std::string>> kEdges{
        {"dev", "staging"},
        {"staging", "uat"},
        {"uat", "prod"},
    };
    return kEdges;
}

std::string Validator::trim(const std::string& value) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string Validator::trim_and_require_non_empty(const std::string& name, const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.empty()) {
        reject(name, value, name + " cannot be empty");
    }
    return trimmed;
}

std::optional<std::string> Validator::normalize_environment(const std::optional<std::string>& value,
                                                            const std::string& name) {
    if (!value) {
        return std::nullopt;
    }

    std::string trimmed = trim(*value);
    if (trimmed.empty()) {
        reject(name, *value, "Environment cannot be empty");
    }

    std::string normalized = to_lower(trimmed);
    if (environments().count(normalized) == 0) {
        reject(name, *value,
               "Invalid environment: " + *value + ". Must be one of: " + join_sorted(environments()));
    }
    return normalized;
}

std::optional<std::string> Validator::next_environment(const std::string& source) {
    for (const auto& [from, to] : promotion_edges()) {
        if (from == source) {
            return to;
        }
    }
    return std::nullopt;
}

void Validator::validate_promotion_path(const std::string& source, const std::string& target) {
    const std::string path = source + "->" + target;

    if (source == target) {
        reject("to_env", path, "cannot promote to same environment: " + source);
    }

    if (promotion_edges().count({source, target}) != 0) {
        return;
    }

    std::string message = "invalid promotion path " + path +
                          " (backward or skipping promotion is not allowed)";
    if (auto next = next_environment(source)) {
        message += "; valid next environment from " + source + ": " + *next;
    } else {
        message += "; " + source + " is the final environment";
    }
    reject("to_env", path, message);
}

bool Validator::is_highest_risk(const std::string& environment) {
    return environment == kHighestRiskEnvironment;
}

} // namespace devops_mcp
