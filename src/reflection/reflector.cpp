#include "reflection/reflector.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace planloop::reflection {

using protocol::AttemptOutcome;
using protocol::ExecutionResult;
using protocol::Feedback;

namespace {

constexpr std::size_t kExcerptLength = 200;

std::string excerpt(const std::string& text) {
    std::string trimmed = text;
    while (!trimmed.empty() &&
           (trimmed.back() == '\n' || trimmed.back() == '\r' || trimmed.back() == ' ')) {
        trimmed.pop_back();
    }
    if (trimmed.size() <= kExcerptLength) {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - kExcerptLength);
}

const ExecutionResult* find_execution(const std::vector<ExecutionResult>& executions,
                                      const std::size_t step_index) {
    for (const auto& execution : executions) {
        if (execution.step_index == step_index) {
            return &execution;
        }
    }
    return nullptr;
}

std::string narrate_parse_failure(const AttemptRecord& record) {
    std::ostringstream out;
    out << "Attempt " << record.attempt_index
        << ": planner response could not be parsed, reason: "
        << (record.parse_error.has_value() ? record.parse_error->message
                                           : std::string("unknown"));
    return out.str();
}

std::string narrate_rejection(const AttemptRecord& record) {
    std::ostringstream out;
    out << "Attempt " << record.attempt_index
        << ": plan rejected before execution, reason: " << record.diagnostics.size()
        << " blocking diagnostic(s)";
    for (const auto& diagnostic : record.diagnostics) {
        out << "\n- [" << protocol::to_string(diagnostic.kind) << "] " << diagnostic.message;
    }
    return out.str();
}

std::string narrate_execution(const AttemptRecord& record) {
    std::size_t tool_steps = 0;
    std::size_t succeeded = 0;
    std::ostringstream details;

    for (const auto& step : record.plan.steps) {
        if (!step.is_tool()) {
            continue;
        }
        ++tool_steps;
        const auto& name = step.tool()->tool_name;
        const auto* execution = find_execution(record.executions, step.index);
        if (execution == nullptr) {
            details << "\n- step " << step.index << " (" << name << ") was not executed";
            continue;
        }
        if (execution->success()) {
            ++succeeded;
            continue;
        }
        details << "\n- step " << step.index << " (" << name << ") ";
        if (execution->fault.has_value()) {
            details << "could not run: " << execution->fault.value();
            continue;
        }
        details << "failed with " << execution->status_text();
        const std::string output = execution->stderr_text.empty()
                                       ? excerpt(execution->stdout_text)
                                       : excerpt(execution->stderr_text);
        if (!output.empty()) {
            details << ": " << output;
        }
    }

    for (const auto& simulation : record.simulations) {
        if (simulation.risk_flag) {
            details << "\n- step " << simulation.step_index << " (" << simulation.tool_name
                    << ") simulation risk: " << simulation.risk_reason;
        }
    }

    std::ostringstream out;
    out << "Attempt " << record.attempt_index << ": ";
    if (succeeded == tool_steps) {
        out << "all " << tool_steps << " tool step(s) succeeded";
    } else {
        out << succeeded << " of " << tool_steps << " tool step(s) succeeded";
    }
    out << details.str();
    return out.str();
}

}  // namespace

bool attempt_succeeded(const AttemptRecord& record) {
    if (record.outcome != AttemptOutcome::Executed ||
        protocol::has_blocking(record.diagnostics)) {
        return false;
    }
    for (const auto& step : record.plan.steps) {
        if (!step.is_tool()) {
            continue;
        }
        const auto* execution = find_execution(record.executions, step.index);
        if (execution == nullptr || !execution->success()) {
            return false;
        }
    }
    return true;
}

Reflector::Reflector(std::string goal) : goal_(std::move(goal)) {}

Feedback Reflector::summarize(const AttemptRecord& record) const {
    Feedback feedback;
    feedback.goal = goal_;
    feedback.plan_attempt_index = record.attempt_index;
    feedback.outcome = record.outcome;
    feedback.diagnostics = record.diagnostics;
    feedback.simulation_results = record.simulations;
    feedback.execution_results = record.executions;
    feedback.succeeded = attempt_succeeded(record);

    switch (record.outcome) {
        case AttemptOutcome::ParseFailure:
            feedback.narrative_summary = narrate_parse_failure(record);
            break;
        case AttemptOutcome::Rejected:
            feedback.narrative_summary = narrate_rejection(record);
            break;
        case AttemptOutcome::Executed:
            feedback.narrative_summary = narrate_execution(record);
            break;
    }
    return feedback;
}

core::errors::Result<Feedback> Reflector::reflect(const AttemptRecord& record,
                                                  session::RunLog& run_log) const {
    Feedback feedback = summarize(record);
    auto appended = run_log.append(feedback);
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }
    LOG_DEBUG("Reflector: " + feedback.narrative_summary);
    return feedback;
}

}  // namespace planloop::reflection
