#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/config/lifecycle_config.hpp"
#include "core/errors/lifecycle_errors.hpp"
#include "planning/planner_oracle.hpp"
#include "protocol/feedback.hpp"
#include "protocol/plan.hpp"
#include "session/run_log.hpp"
#include "tools/tool_registry.hpp"

namespace planloop::runtime {

enum class LifecycleState {
    Planning,
    Validating,
    Simulating,
    Executing,
    Reflecting,
    Deciding,
    Succeeded,
    Failed
};

struct Transition {
    std::uint32_t attempt_index = 0;
    LifecycleState from = LifecycleState::Planning;
    LifecycleState to = LifecycleState::Planning;
};

enum class RunStatus {
    Succeeded,
    Failed
};

struct RunOutcome {
    RunStatus status = RunStatus::Failed;
    std::uint32_t attempts = 0;
    // Why the run gave up: "lifecycle_exhausted", "planner_unparseable",
    // or an internal error code.
    std::optional<core::errors::LifecycleError> failure;
    session::RunLog run_log;
    std::vector<Transition> transitions;
};

std::string to_string(LifecycleState state);
std::string to_string(RunStatus status);

// Drives one goal through plan -> validate -> simulate -> execute ->
// reflect, replanning until an attempt succeeds, the attempt cap is hit,
// or the planner fails to produce a parseable plan too many times in a
// row. Deterministic for a given sequence of planner responses.
class LifecycleOrchestrator {
public:
    using FeedbackListener = std::function<void(const protocol::Feedback&)>;

    // replanner may be null, in which case the planner is asked again.
    LifecycleOrchestrator(const tools::ToolRegistry& registry,
                          planning::PlannerOracle& planner,
                          planning::PlannerOracle* replanner,
                          core::config::LifecycleConfig config,
                          std::filesystem::path working_directory);

    // Called after each attempt's Feedback is appended to the run log.
    void set_feedback_listener(FeedbackListener listener);

    RunOutcome run(const protocol::Goal& goal);

private:
    const tools::ToolRegistry& registry_;
    planning::PlannerOracle& planner_;
    planning::PlannerOracle* replanner_;
    core::config::LifecycleConfig config_;
    std::filesystem::path working_directory_;
    FeedbackListener feedback_listener_;
};

}  // namespace planloop::runtime
