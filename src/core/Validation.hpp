#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>

namespace devops_mcp {

/**
 * @brief Parameter normalization and business-rule checks for DevOps tools
 *
 * All functions are stateless: the same input always produces the same
 * normalized value or the same ValidationError. Failures are logged at
 * warning level before being thrown.
 */
class Validator {
public:
    /// Environment that receives audited, highest-risk deployments
    static constexpr const char* kHighestRiskEnvironment = "prod";

    /**
     * @brief Whitelisted environment names (lower case)
     */
    static const std::set<std::string>& environments();

    /**
     * @brief Allowed forward promotions: dev->staging, staging->uat, uat->prod
     */
    static const std::set<std::pair<std::string, std::string>>& promotion_edges();

    /**
     * @brief Trim ASCII whitespace and reject empty results
     *
     * @param name Parameter name used in the error message
     * @param value Raw value
     * @return Trimmed value
     * @throws ValidationError "<name> cannot be empty"
     */
    static std::string trim_and_require_non_empty(const std::string& name, const std::string& value);

    /**
     * @brief Normalize an optional environment name
     *
     * nullopt means "all environments" and passes through unchanged.
     * Present values are trimmed, lower-cased and checked against the
     * whitelist.
     *
     * @throws ValidationError listing the valid options (sorted) on mismatch
     */
    static std::optional<std::string> normalize_environment(const std::optional<std::string>& value,
                                                            const std::string& name = "environment");

    /**
     * @brief Check that source -> target is an allowed forward promotion
     *
     * Both arguments must already be normalized.
     *
     * @throws ValidationError on same-environment, skipping or backward moves
     */
    static void validate_promotion_path(const std::string& source, const std::string& target);

    /**
     * @brief Valid next hop from an environment, if any
     */
    static std::optional<std::string> next_environment(const std::string& source);

    static bool is_highest_risk(const std::string& environment);

    /**
     * @brief Strip leading/trailing ASCII whitespace
     */
    static std::string trim(const std::string& value);
};

} // namespace devops_mcp
