#include "core/Validation.hpp"
#include "core/ToolError.hpp"
#include <gtest/gtest.h>
#include <functional>

using namespace devops_mcp;

namespace {

std::string validation_message(const std::function<void()>& action) {
    try {
        action();
    } catch (const ValidationError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(ValidationTest, TrimAndRequireNonEmpty) {
    EXPECT_EQ(Validator::trim_and_require_non_empty("app", "  web-api \t"), "web-api");
    EXPECT_EQ(Validator::trim_and_require_non_empty("app", "web-api"), "web-api");

    EXPECT_EQ(validation_message([] { Validator::trim_and_require_non_empty("app", "   "); }),
              "app cannot be empty");
    EXPECT_EQ(validation_message([] { Validator::trim_and_require_non_empty("version", ""); }),
              "version cannot be empty");
}

TEST(ValidationTest, ValidationErrorNamesParameter) {
    try {
        Validator::trim_and_require_non_empty("from_env", "");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.parameter(), "from_env");
        EXPECT_EQ(e.kind(), ToolErrorKind::Validation);
        EXPECT_EQ(e.rpc_code(), rpc_error::kInvalidParams);
        EXPECT_EQ(e.context()["parameter"], "from_env");
    }
}

TEST(ValidationTest, NormalizeEnvironment) {
    EXPECT_EQ(Validator::normalize_environment(std::nullopt), std::nullopt);
    EXPECT_EQ(Validator::normalize_environment(std::string("prod")), "prod");
    EXPECT_EQ(Validator::normalize_environment(std::string("  PROD ")), "prod");
    EXPECT_EQ(Validator::normalize_environment(std::string("Staging")), "staging");

    for (const auto& env : Validator::environments()) {
        // Normalizing twice changes nothing
        auto once = Validator::normalize_environment(env);
        EXPECT_EQ(Validator::normalize_environment(once), once);
    }
}

TEST(ValidationTest, NormalizeEnvironmentRejectsUnknown) {
    std::string message = validation_message([] { Validator::normalize_environment(std::string("qa")); });
    EXPECT_EQ(message, "Invalid environment: qa. Must be one of: dev, prod, staging, uat");

    EXPECT_EQ(validation_message([] { Validator::normalize_environment(std::string("  ")); }),
              "Environment cannot be empty");

    try {
        Validator::normalize_environment(std::string("production"), "env");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.parameter(), "env");
    }
}

TEST(ValidationTest, PromotionPathIsTotalOverEnvironmentPairs) {
    const std::set<std::pair<std::string, std::string>> allowed{
        {"dev", "staging"}, {"staging", "uat"}, {"uat", "prod"}};

    int checked = 0;
    for (const auto& from : Validator::environments()) {
        for (const auto& to : Validator::environments()) {
            ++checked;
            if (allowed.count({from, to}) != 0) {
                EXPECT_NO_THROW(Validator::validate_promotion_path(from, to)) << from << "->" << to;
            } else {
                EXPECT_THROW(Validator::validate_promotion_path(from, to), ValidationError) << from << "->" << to;
            }
        }
    }
    EXPECT_EQ(checked, 16);
}

TEST(ValidationTest, PromotionPathMessages) {
    std::string same = validation_message([] { Validator::validate_promotion_path("uat", "uat"); });
    EXPECT_EQ(same, "cannot promote to same environment: uat");

    std::string skipping = validation_message([] { Validator::validate_promotion_path("dev", "uat"); });
    EXPECT_NE(skipping.find("dev->uat"), std::string::npos);
    EXPECT_NE(skipping.find("staging"), std::string::npos);

    std::string backward = validation_message([] { Validator::validate_promotion_path("prod", "staging"); });
    EXPECT_NE(backward.find("backward"), std::string::npos);
    EXPECT_NE(backward.find("prod is the final environment"), std::string::npos);

    try {
        Validator::validate_promotion_path("staging", "dev");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.parameter(), "to_env");
    }
}

TEST(ValidationTest, NextEnvironmentAndRisk) {
    EXPECT_EQ(Validator::next_environment("dev"), "staging");
    EXPECT_EQ(Validator::next_environment("staging"), "uat");
    EXPECT_EQ(Validator::next_environment("uat"), "prod");
    EXPECT_EQ(Validator::next_environment("prod"), std::nullopt);

    EXPECT_TRUE(Validator::is_highest_risk("prod"));
    EXPECT_FALSE(Validator::is_highest_risk("uat"));
}
