#include <string>
#include <gtest/gtest.h>
#include "planning/plan_extractor.hpp"

namespace {

using planloop::core::errors::ErrorCategory;
using planloop::core::errors::get_error;
using planloop::core::errors::get_value;
using planloop::core::errors::is_error;
using planloop::planning::extract_plan_payload;
using planloop::planning::strip_reasoning_blocks;

TEST(PlanExtractorTest, ParsesBareObject) {
    auto result = extract_plan_payload(R"({"plan": [{"type": "info", "text": "hi"}]})");
    ASSERT_FALSE(is_error(result));
    const auto& payload = get_value(result);
    ASSERT_TRUE(payload.at("plan").is_array());
    EXPECT_EQ(payload.at("plan").size(), 1u);
}

TEST(PlanExtractorTest, SkipsProseAndCodeFences) {
    const std::string raw =
        "Here is the plan you asked for:\n```json\n"
        "{\"plan\": [{\"type\": \"tool\", \"tool\": \"git_status\", \"inputs\": {}}]}\n"
        "```\nLet me know if you need more.";
    auto result = extract_plan_payload(raw);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("plan").at(0).at("tool").get<std::string>(), "git_status");
}

TEST(PlanExtractorTest, IgnoresObjectsInsideReasoningBlocks) {
    const std::string raw =
        "<think>maybe {\"plan\": [{\"type\": \"info\", \"text\": \"draft\"}]}</think>"
        "{\"plan\": [{\"type\": \"info\", \"text\": \"final\"}]}";
    auto result = extract_plan_payload(raw);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("plan").at(0).at("text").get<std::string>(), "final");
}

TEST(PlanExtractorTest, SkipsObjectsWithoutPlanArray) {
    const std::string raw =
        "{\"note\": \"not this\"} then {\"plan\": \"nope\"} and finally "
        "{\"plan\": []}";
    auto result = extract_plan_payload(raw);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).at("plan").empty());
}

TEST(PlanExtractorTest, BracesInsideStringsDoNotBreakScan) {
    const std::string raw =
        R"({"plan": [{"type": "info", "text": "use } and { freely"}]})";
    auto result = extract_plan_payload(raw);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("plan").at(0).at("text").get<std::string>(), "use } and { freely");
}

TEST(PlanExtractorTest, FindsPlanNestedInWrapper) {
    auto result = extract_plan_payload(R"({"response": {"plan": []}})");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).contains("plan"));
}

TEST(PlanExtractorTest, EmptyResponseIsParseError) {
    auto blank = extract_plan_payload("   \n\t");
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).category, ErrorCategory::Parse);
    EXPECT_EQ(get_error(blank).code, "empty_response");

    auto only_thoughts = extract_plan_payload("<think>hmm</think>");
    ASSERT_TRUE(is_error(only_thoughts));
    EXPECT_EQ(get_error(only_thoughts).code, "empty_response");
}

TEST(PlanExtractorTest, ProseWithoutPlanIsParseError) {
    auto result = extract_plan_payload("I could not come up with a plan, sorry.");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Parse);
    EXPECT_EQ(get_error(result).code, "no_plan_payload");
    EXPECT_FALSE(get_error(result).hint.empty());

    auto truncated = extract_plan_payload(R"({"plan": [{"type": "info")");
    ASSERT_TRUE(is_error(truncated));
    EXPECT_EQ(get_error(truncated).code, "no_plan_payload");
}

TEST(PlanExtractorTest, StripsTagsCaseInsensitively) {
    EXPECT_EQ(strip_reasoning_blocks("a<THINK>x</Think>b<reasoning>y</reasoning>c"), "abc");
    EXPECT_EQ(strip_reasoning_blocks("keep<thought>unterminated"), "keep");
    EXPECT_EQ(strip_reasoning_blocks("no tags"), "no tags");
}

}  // namespace
