#include "simulation/simulator.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace planloop::simulation {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using protocol::SimulationResult;

Simulator::Simulator(const tools::ToolRegistry& registry) : registry_(registry) {}

core::errors::Result<std::vector<SimulationResult>> Simulator::simulate(
    const validation::ValidationReport& report) const {
    if (!report.executable()) {
        return LifecycleError{ErrorCategory::Internal,
                              "Refusing to simulate a plan with blocking diagnostics.",
                              "plan_not_executable"};
    }

    std::vector<SimulationResult> results;
    for (const auto& step : report.plan.steps) {
        const auto* tool_step = step.tool();
        if (tool_step == nullptr) {
            continue;
        }

        SimulationResult result;
        result.step_index = step.index;
        result.tool_name = tool_step->tool_name;

        const auto tool = registry_.find(tool_step->tool_name);
        if (!tool) {
            result.risk_flag = true;
            result.risk_reason = "tool is not registered";
        } else {
            result.read_only = tool->spec().read_only;
            auto predicted = tool->predict(tool_step->inputs);
            if (core::errors::is_error(predicted)) {
                result.risk_flag = true;
                result.risk_reason = core::errors::get_error(predicted).message;
            } else {
                result.predicted_effect = core::errors::get_value(predicted);
            }
        }

        if (result.risk_flag) {
            LOG_WARN("Simulator: step " + std::to_string(step.index) + " (" +
                     result.tool_name + ") could not be predicted: " + result.risk_reason);
        } else {
            LOG_DEBUG("Simulator: step " + std::to_string(step.index) + " -> " +
                      result.predicted_effect);
        }
        results.push_back(std::move(result));
    }
    return results;
}

}  // namespace planloop::simulation
