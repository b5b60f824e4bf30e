#include <gtest/gtest.h>
#include "session/run_log.hpp"

namespace {

using planloop::core::errors::get_error;
using planloop::core::errors::is_error;
using planloop::protocol::Feedback;
using planloop::session::RunLog;

Feedback feedback_for(std::uint32_t attempt, const std::string& narrative) {
    Feedback feedback;
    feedback.goal = "keep the log ordered";
    feedback.plan_attempt_index = attempt;
    feedback.narrative_summary = narrative;
    return feedback;
}

TEST(RunLogTest, StartsEmpty) {
    RunLog log;
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(log.latest(), nullptr);
    EXPECT_EQ(log.find_attempt(1), nullptr);
}

TEST(RunLogTest, AppendsInOrderAndLooksUpByAttempt) {
    RunLog log;
    ASSERT_FALSE(is_error(log.append(feedback_for(1, "first"))));
    ASSERT_FALSE(is_error(log.append(feedback_for(2, "second"))));

    EXPECT_EQ(log.size(), 2u);
    ASSERT_NE(log.latest(), nullptr);
    EXPECT_EQ(log.latest()->narrative_summary, "second");
    ASSERT_NE(log.find_attempt(1), nullptr);
    EXPECT_EQ(log.find_attempt(1)->narrative_summary, "first");
    EXPECT_EQ(log.entries()[1].plan_attempt_index, 2u);
}

TEST(RunLogTest, RejectsRepeatedOrEarlierAttempts) {
    RunLog log;
    ASSERT_FALSE(is_error(log.append(feedback_for(2, "second"))));

    auto repeated = log.append(feedback_for(2, "again"));
    ASSERT_TRUE(is_error(repeated));
    EXPECT_EQ(get_error(repeated).code, "out_of_order_feedback");

    auto earlier = log.append(feedback_for(1, "late"));
    ASSERT_TRUE(is_error(earlier));
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(log.latest()->narrative_summary, "second");
}

}  // namespace
