#include "runtime/lifecycle_orchestrator.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"
#include "planning/plan_extractor.hpp"
#include "protocol/json_codec.hpp"
#include "reflection/reflector.hpp"
#include "runtime/plan_executor.hpp"
#include "simulation/simulator.hpp"
#include "validation/plan_validator.hpp"

namespace planloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using protocol::AttemptOutcome;

std::string to_string(const LifecycleState state) {
    switch (state) {
        case LifecycleState::Planning:
            return "planning";
        case LifecycleState::Validating:
            return "validating";
        case LifecycleState::Simulating:
            return "simulating";
        case LifecycleState::Executing:
            return "executing";
        case LifecycleState::Reflecting:
            return "reflecting";
        case LifecycleState::Deciding:
            return "deciding";
        case LifecycleState::Succeeded:
            return "succeeded";
        case LifecycleState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded:
            return "succeeded";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

LifecycleOrchestrator::LifecycleOrchestrator(const tools::ToolRegistry& registry,
                                             planning::PlannerOracle& planner,
                                             planning::PlannerOracle* replanner,
                                             core::config::LifecycleConfig config,
                                             std::filesystem::path working_directory)
    : registry_(registry),
      planner_(planner),
      replanner_(replanner),
      config_(std::move(config)),
      working_directory_(std::move(working_directory)) {}

void LifecycleOrchestrator::set_feedback_listener(FeedbackListener listener) {
    feedback_listener_ = std::move(listener);
}

RunOutcome LifecycleOrchestrator::run(const protocol::Goal& goal) {
    RunOutcome outcome;
    LifecycleState state = LifecycleState::Planning;
    std::uint32_t attempt = 1;

    auto transition = [&](const LifecycleState next) {
        LOG_INFO("Lifecycle: attempt " + std::to_string(attempt) + " transition " +
                 to_string(state) + " -> " + to_string(next));
        outcome.transitions.push_back(Transition{attempt, state, next});
        state = next;
    };
    auto finish = [&](const RunStatus status, std::optional<LifecycleError> failure) {
        transition(status == RunStatus::Succeeded ? LifecycleState::Succeeded
                                                  : LifecycleState::Failed);
        outcome.status = status;
        outcome.attempts = attempt;
        outcome.failure = std::move(failure);
        return std::move(outcome);
    };

    const validation::PlanValidator validator(registry_);
    const simulation::Simulator simulator(registry_);
    const PlanExecutor executor(registry_);
    const reflection::Reflector reflector(goal.text);
    std::uint32_t consecutive_parse_failures = 0;

    LOG_INFO("Lifecycle: goal \"" + goal.text + "\", at most " +
             std::to_string(config_.max_attempts) + " attempt(s)");

    while (true) {
        reflection::AttemptRecord record;
        record.attempt_index = attempt;

        // Planning
        const bool replanning = attempt > 1;
        planning::PlanningRequest request;
        request.goal = goal.text;
        request.attempt_index = attempt;
        request.replanning = replanning;
        request.tools = registry_.all();
        request.run_log = outcome.run_log.entries();
        request.timeout_ms = config_.planner_timeout_ms;

        planning::PlannerOracle& oracle =
            (replanning && replanner_ != nullptr) ? *replanner_ : planner_;
        const auto planner_started = std::chrono::steady_clock::now();
        auto response = oracle.propose(request);
        const auto planner_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - planner_started)
                                         .count();

        core::errors::Result<nlohmann::json> payload = nlohmann::json();
        if (core::errors::is_error(response)) {
            payload = core::errors::get_error(response);
        } else if (planner_elapsed > static_cast<std::int64_t>(config_.planner_timeout_ms)) {
            payload = LifecycleError{ErrorCategory::Deadline,
                                     "Planner answered after its deadline of " +
                                         std::to_string(config_.planner_timeout_ms) + " ms",
                                     "deadline_exceeded"};
        } else {
            payload = planning::extract_plan_payload(core::errors::get_value(response));
        }

        if (core::errors::is_error(payload)) {
            const auto& err = core::errors::get_error(payload);
            LOG_WARN("Lifecycle: attempt " + std::to_string(attempt) +
                     " planner output unusable [" + err.code + "]: " + err.message);
            ++consecutive_parse_failures;
            record.outcome = AttemptOutcome::ParseFailure;
            record.parse_error = err;
            transition(LifecycleState::Reflecting);
        } else {
            consecutive_parse_failures = 0;
            transition(LifecycleState::Validating);

            protocol::PlanProvenance provenance;
            provenance.attempt_index = attempt;
            provenance.source =
                replanning ? protocol::PlanSource::Replanner : protocol::PlanSource::Planner;
            const auto report = validator.validate(core::errors::get_value(payload), provenance);
            if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
                LOG_DEBUG("Lifecycle: attempt " + std::to_string(attempt) + " plan " +
                          protocol::plan_to_json(report.plan).dump());
            }
            record.plan = report.plan;
            record.diagnostics = report.diagnostics;

            if (!report.executable()) {
                LOG_WARN("Lifecycle: attempt " + std::to_string(attempt) + " plan rejected with " +
                         std::to_string(report.diagnostics.size()) + " diagnostic(s)");
                record.outcome = AttemptOutcome::Rejected;
                transition(LifecycleState::Reflecting);
            } else {
                record.outcome = AttemptOutcome::Executed;

                transition(LifecycleState::Simulating);
                auto simulations = simulator.simulate(report);
                if (core::errors::is_error(simulations)) {
                    return finish(RunStatus::Failed, core::errors::get_error(simulations));
                }
                record.simulations = core::errors::get_value(simulations);

                transition(LifecycleState::Executing);
                ExecutionSettings settings;
                settings.working_directory = working_directory_;
                settings.step_timeout_ms = config_.step_timeout_ms;
                settings.deadline = std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(config_.attempt_timeout_ms);
                auto executions = executor.execute(report, settings);
                if (core::errors::is_error(executions)) {
                    return finish(RunStatus::Failed, core::errors::get_error(executions));
                }
                record.executions = core::errors::get_value(executions);

                transition(LifecycleState::Reflecting);
            }
        }

        auto feedback = reflector.reflect(record, outcome.run_log);
        if (core::errors::is_error(feedback)) {
            return finish(RunStatus::Failed, core::errors::get_error(feedback));
        }
        if (feedback_listener_) {
            feedback_listener_(core::errors::get_value(feedback));
        }

        transition(LifecycleState::Deciding);
        if (core::errors::get_value(feedback).succeeded) {
            return finish(RunStatus::Succeeded, std::nullopt);
        }
        if (consecutive_parse_failures >= config_.max_consecutive_parse_failures) {
            return finish(RunStatus::Failed,
                          LifecycleError{ErrorCategory::Lifecycle,
                                         "Planner returned no parseable plan on " +
                                             std::to_string(consecutive_parse_failures) +
                                             " consecutive attempts",
                                         "planner_unparseable"});
        }
        if (attempt >= config_.max_attempts) {
            return finish(RunStatus::Failed,
                          LifecycleError{ErrorCategory::Lifecycle,
                                         "Goal not reached after " + std::to_string(attempt) +
                                             " attempt(s)",
                                         "lifecycle_exhausted"});
        }

        transition(LifecycleState::Planning);
        ++attempt;
    }
}

}  // namespace planloop::runtime
