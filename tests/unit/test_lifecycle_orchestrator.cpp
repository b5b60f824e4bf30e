#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/lifecycle_config.hpp"
#include "planning/planner_oracle.hpp"
#include "runtime/lifecycle_orchestrator.hpp"
#include "tools/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using planloop::core::config::LifecycleConfig;
using planloop::core::errors::is_error;
using planloop::planning::ScriptedOracle;
using planloop::protocol::AttemptOutcome;
using planloop::protocol::DiagnosticKind;
using planloop::protocol::Feedback;
using planloop::protocol::Goal;
using planloop::runtime::LifecycleOrchestrator;
using planloop::runtime::LifecycleState;
using planloop::runtime::RunOutcome;
using planloop::runtime::RunStatus;
using planloop::runtime::Transition;
using planloop::testing::CallLog;
using planloop::testing::FakeTool;
using planloop::testing::exited;
using planloop::tools::ToolRegistry;

const char* kStatusPlan = R"({"plan": [{"type": "tool", "tool": "git_status", "inputs": {}}]})";
const char* kUnknownToolPlan =
    R"({"plan": [{"type": "tool", "tool": "delete_everything", "inputs": {}}]})";

std::vector<std::pair<LifecycleState, LifecycleState>> edges(const RunOutcome& outcome) {
    std::vector<std::pair<LifecycleState, LifecycleState>> out;
    for (const auto& transition : outcome.transitions) {
        out.emplace_back(transition.from, transition.to);
    }
    return out;
}

class LifecycleOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<CallLog>();
        status_ = std::make_shared<FakeTool>("git_status", std::set<std::string>{}, log_);
        status_->set_read_only(true);
        reader_ = std::make_shared<FakeTool>("read_file", std::set<std::string>{"path"}, log_);
        reader_->set_read_only(true);
        ASSERT_FALSE(is_error(registry_.register_tool(status_)));
        ASSERT_FALSE(is_error(registry_.register_tool(reader_)));
        config_.step_timeout_ms = 5000;
        config_.attempt_timeout_ms = 10000;
    }

    RunOutcome run(ScriptedOracle& planner, ScriptedOracle* replanner = nullptr,
                   const std::string& goal = "check repo state") {
        LifecycleOrchestrator orchestrator(registry_, planner, replanner, config_,
                                           std::filesystem::current_path());
        orchestrator.set_feedback_listener(
            [this](const Feedback& feedback) { delivered_.push_back(feedback); });
        return orchestrator.run(Goal{goal});
    }

    std::size_t execute_calls() const {
        std::size_t count = 0;
        for (const auto& call : log_->calls) {
            if (call.rfind("execute:", 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    std::shared_ptr<CallLog> log_;
    std::shared_ptr<FakeTool> status_;
    std::shared_ptr<FakeTool> reader_;
    ToolRegistry registry_;
    LifecycleConfig config_;
    std::vector<Feedback> delivered_;
};

TEST_F(LifecycleOrchestratorTest, SingleReadOnlyStepSucceedsOnFirstAttempt) {
    ScriptedOracle planner({kStatusPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_FALSE(outcome.failure.has_value());
    EXPECT_EQ(edges(outcome),
              (std::vector<std::pair<LifecycleState, LifecycleState>>{
                  {LifecycleState::Planning, LifecycleState::Validating},
                  {LifecycleState::Validating, LifecycleState::Simulating},
                  {LifecycleState::Simulating, LifecycleState::Executing},
                  {LifecycleState::Executing, LifecycleState::Reflecting},
                  {LifecycleState::Reflecting, LifecycleState::Deciding},
                  {LifecycleState::Deciding, LifecycleState::Succeeded}}));

    EXPECT_EQ(log_->calls, (std::vector<std::string>{"predict:git_status", "execute:git_status"}));
    ASSERT_EQ(outcome.run_log.size(), 1u);
    const auto& feedback = *outcome.run_log.latest();
    EXPECT_TRUE(feedback.succeeded);
    EXPECT_TRUE(feedback.diagnostics.empty());
    ASSERT_EQ(feedback.simulation_results.size(), 1u);
    EXPECT_TRUE(feedback.simulation_results[0].read_only);
    ASSERT_EQ(delivered_.size(), 1u);
    EXPECT_EQ(planner.requests().size(), 1u);
    EXPECT_FALSE(planner.requests()[0].replanning);
    EXPECT_EQ(planner.requests()[0].tools.size(), 2u);
}

TEST_F(LifecycleOrchestratorTest, UnknownToolIsRejectedAndReplanned) {
    ScriptedOracle planner({kUnknownToolPlan});
    ScriptedOracle replanner({kStatusPlan});
    const auto outcome = run(planner, &replanner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 2u);
    ASSERT_EQ(outcome.run_log.size(), 2u);

    const auto* first = outcome.run_log.find_attempt(1);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->outcome, AttemptOutcome::Rejected);
    ASSERT_EQ(first->diagnostics.size(), 1u);
    EXPECT_EQ(first->diagnostics[0].kind, DiagnosticKind::UnknownTool);
    EXPECT_EQ(first->diagnostics[0].step_index, 0u);
    EXPECT_NE(first->narrative_summary.find("delete_everything"), std::string::npos);
    EXPECT_TRUE(first->execution_results.empty());

    ASSERT_EQ(planner.requests().size(), 1u);
    ASSERT_EQ(replanner.requests().size(), 1u);
    const auto& replan_request = replanner.requests()[0];
    EXPECT_EQ(replan_request.attempt_index, 2u);
    EXPECT_TRUE(replan_request.replanning);
    ASSERT_EQ(replan_request.run_log.size(), 1u);
    EXPECT_EQ(replan_request.run_log[0].narrative_summary, first->narrative_summary);

    EXPECT_EQ(log_->calls, (std::vector<std::string>{"predict:git_status", "execute:git_status"}));
}

TEST_F(LifecycleOrchestratorTest, PlaceholderBlocksExecutionAndIsNamedInFeedback) {
    ScriptedOracle planner({
        R"({"plan": [{"type": "tool", "tool": "read_file", "inputs": {"path": "<file>"}}]})",
        R"({"plan": [{"type": "tool", "tool": "read_file", "inputs": {"path": "README.md"}}]})",
    });
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 2u);
    const auto* first = outcome.run_log.find_attempt(1);
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(first->diagnostics.size(), 1u);
    EXPECT_EQ(first->diagnostics[0].kind, DiagnosticKind::PlaceholderDetected);
    EXPECT_NE(first->narrative_summary.find("<file>"), std::string::npos);

    ASSERT_EQ(reader_->execute_count(), 1u);
    EXPECT_EQ(log_->inputs[0].at("path"), "README.md");
    ASSERT_EQ(planner.requests().size(), 2u);
    EXPECT_EQ(planner.requests()[1].attempt_index, 2u);
}

TEST_F(LifecycleOrchestratorTest, AttemptCapEndsRunAfterExactlyThatManyAttempts) {
    config_.max_attempts = 3;
    ScriptedOracle planner({kUnknownToolPlan, kUnknownToolPlan, kUnknownToolPlan, kStatusPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Failed);
    EXPECT_EQ(outcome.attempts, 3u);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, "lifecycle_exhausted");
    EXPECT_EQ(outcome.run_log.size(), 3u);
    EXPECT_EQ(planner.requests().size(), 3u);
    EXPECT_EQ(execute_calls(), 0u);
    EXPECT_TRUE(log_->calls.empty());
    ASSERT_FALSE(outcome.transitions.empty());
    EXPECT_EQ(outcome.transitions.back().to, LifecycleState::Failed);
    EXPECT_EQ(outcome.transitions.back().attempt_index, 3u);
}

TEST_F(LifecycleOrchestratorTest, TwoConsecutiveParseFailuresAbort) {
    ScriptedOracle planner({"I am not sure what to do.", "<think>hmm</think>", kStatusPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Failed);
    EXPECT_EQ(outcome.attempts, 2u);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, "planner_unparseable");
    ASSERT_EQ(outcome.run_log.size(), 2u);
    EXPECT_EQ(outcome.run_log.entries()[0].outcome, AttemptOutcome::ParseFailure);
    EXPECT_EQ(outcome.run_log.entries()[1].outcome, AttemptOutcome::ParseFailure);
    EXPECT_EQ(edges(outcome)[0],
              std::make_pair(LifecycleState::Planning, LifecycleState::Reflecting));
}

TEST_F(LifecycleOrchestratorTest, ParseFailuresSeparatedByAPlanDoNotAbort) {
    config_.max_attempts = 5;
    ScriptedOracle planner({"garbage", kUnknownToolPlan, "garbage", kStatusPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 4u);
    EXPECT_EQ(outcome.run_log.size(), 4u);
}

TEST_F(LifecycleOrchestratorTest, ExhaustedOracleCountsAsParseFailure) {
    ScriptedOracle planner({kUnknownToolPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Failed);
    EXPECT_EQ(outcome.attempts, 3u);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, "planner_unparseable");
}

TEST_F(LifecycleOrchestratorTest, FailedToolStepTriggersReplan) {
    status_->then(exited(128, "", "fatal: not a git repository"));
    ScriptedOracle planner({kStatusPlan, kStatusPlan});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(status_->execute_count(), 2u);
    const auto* first = outcome.run_log.find_attempt(1);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->outcome, AttemptOutcome::Executed);
    EXPECT_FALSE(first->succeeded);
    EXPECT_NE(first->narrative_summary.find("not a git repository"), std::string::npos);
}

TEST_F(LifecycleOrchestratorTest, EmptyPlanSucceeds) {
    ScriptedOracle planner({R"(Nothing to do. {"plan": []})"});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_TRUE(log_->calls.empty());
}

TEST_F(LifecycleOrchestratorTest, ToolsAreSimulatedThenExecutedOncePerStepInOrder) {
    ScriptedOracle planner({R"({"plan": [
        {"type": "tool", "tool": "read_file", "inputs": {"path": "a.txt"}},
        {"type": "info", "text": "between"},
        {"type": "tool", "tool": "git_status", "inputs": {}},
        {"type": "tool", "tool": "read_file", "inputs": {"path": "b.txt"}}
    ]})"});
    const auto outcome = run(planner);

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(log_->calls,
              (std::vector<std::string>{"predict:read_file", "predict:git_status",
                                        "predict:read_file", "execute:read_file",
                                        "execute:git_status", "execute:read_file"}));
    ASSERT_EQ(log_->inputs.size(), 3u);
    EXPECT_EQ(log_->inputs[0].at("path"), "a.txt");
    EXPECT_EQ(log_->inputs[2].at("path"), "b.txt");
    EXPECT_EQ(outcome.run_log.latest()->execution_results.size(), 4u);
}

TEST_F(LifecycleOrchestratorTest, SameResponsesGiveSameTrace) {
    ScriptedOracle first_planner({kUnknownToolPlan, "garbage", kStatusPlan});
    ScriptedOracle second_planner({kUnknownToolPlan, "garbage", kStatusPlan});
    const auto first = run(first_planner);
    const auto second = run(second_planner);

    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.attempts, second.attempts);
    EXPECT_EQ(edges(first), edges(second));
    ASSERT_EQ(first.run_log.size(), second.run_log.size());
    for (std::size_t i = 0; i < first.run_log.size(); ++i) {
        EXPECT_EQ(first.run_log.entries()[i].narrative_summary,
                  second.run_log.entries()[i].narrative_summary);
    }
}

TEST_F(LifecycleOrchestratorTest, ListenerSeesEveryAttemptInOrder) {
    ScriptedOracle planner({kUnknownToolPlan, "garbage", kStatusPlan});
    const auto outcome = run(planner);

    ASSERT_EQ(delivered_.size(), 3u);
    for (std::size_t i = 0; i < delivered_.size(); ++i) {
        EXPECT_EQ(delivered_[i].plan_attempt_index, i + 1);
    }
    EXPECT_EQ(delivered_[1].outcome, AttemptOutcome::ParseFailure);
    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
}

}  // namespace
