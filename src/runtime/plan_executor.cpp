#include "runtime/plan_executor.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace planloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using protocol::ExecutionResult;

namespace {

std::uint32_t remaining_ms(const std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (deadline <= now) {
        return 0;
    }
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    if (left > static_cast<std::int64_t>(UINT32_MAX)) {
        return UINT32_MAX;
    }
    return static_cast<std::uint32_t>(std::max<std::int64_t>(left, 1));
}

}  // namespace

PlanExecutor::PlanExecutor(const tools::ToolRegistry& registry) : registry_(registry) {}

core::errors::Result<std::vector<ExecutionResult>> PlanExecutor::execute(
    const validation::ValidationReport& report, const ExecutionSettings& settings) const {
    if (!report.executable()) {
        return LifecycleError{ErrorCategory::Internal,
                              "Refusing to execute a plan with blocking diagnostics.",
                              "plan_not_executable"};
    }

    std::vector<ExecutionResult> results;
    for (const auto& step : report.plan.steps) {
        ExecutionResult result;
        result.step_index = step.index;

        const auto* tool_step = step.tool();
        if (tool_step == nullptr) {
            result.info_step = true;
            result.exit_status = 0;
            result.stdout_text = step.info()->text;
            results.push_back(std::move(result));
            continue;
        }
        result.tool_name = tool_step->tool_name;

        const std::uint32_t time_left = remaining_ms(settings.deadline);
        if (time_left == 0) {
            result.fault = "attempt deadline elapsed before the step started";
            LOG_WARN("Executor: step " + std::to_string(step.index) + " (" +
                     result.tool_name + ") " + result.fault.value());
            results.push_back(std::move(result));
            break;
        }

        const auto tool = registry_.find(tool_step->tool_name);
        if (!tool) {
            result.fault = "tool '" + tool_step->tool_name + "' is not registered";
            LOG_ERROR("Executor: step " + std::to_string(step.index) + " " +
                      result.fault.value());
            results.push_back(std::move(result));
            break;
        }

        tools::ToolContext context;
        context.working_directory = settings.working_directory;
        context.timeout_ms = std::min(settings.step_timeout_ms, time_left);

        LOG_INFO("Executor: step " + std::to_string(step.index) + " running " +
                 result.tool_name);
        const auto started = std::chrono::steady_clock::now();
        core::errors::Result<protocol::ToolOutcome> outcome = protocol::ToolOutcome{};
        try {
            outcome = tool->execute(tool_step->inputs, context);
        } catch (const std::exception& ex) {
            outcome = LifecycleError{ErrorCategory::Execution,
                                     std::string("tool threw: ") + ex.what(),
                                     "tool_threw"};
        }
        result.duration_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();

        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            result.fault = err.message;
            LOG_ERROR("Executor: step " + std::to_string(step.index) + " (" +
                      result.tool_name + ") fault [" + err.code + "]: " + err.message);
            results.push_back(std::move(result));
            break;
        }

        const auto& tool_outcome = core::errors::get_value(outcome);
        result.exit_status = tool_outcome.exit_status;
        result.term_signal = tool_outcome.term_signal;
        result.stdout_text = tool_outcome.stdout_text;
        result.stderr_text = tool_outcome.stderr_text;
        LOG_INFO("Executor: step " + std::to_string(step.index) + " (" + result.tool_name +
                 ") " + result.status_text() + (result.success() ? " ok" : " failed"));
        results.push_back(std::move(result));
    }
    return results;
}

}  // namespace planloop::runtime
