#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "tools/tool_registry.hpp"
#include "validation/plan_validator.hpp"

namespace planloop::runtime {

struct ExecutionSettings {
    std::filesystem::path working_directory = std::filesystem::current_path();
    std::uint32_t step_timeout_ms = 30000;
    // Whole-attempt deadline; each step gets min(step timeout, time left).
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
};

// Runs the steps of a validated plan one at a time, in plan order.
// Info steps are recorded as trivially successful. A tool that ran and
// exited non-zero is recorded and execution moves on; a tool that could
// not be invoked, or a deadline overrun, is recorded as a fault and no
// later step runs.
class PlanExecutor {
public:
    explicit PlanExecutor(const tools::ToolRegistry& registry);

    // Fails with "plan_not_executable" if the report carries blocking
    // diagnostics; no step is touched in that case.
    core::errors::Result<std::vector<protocol::ExecutionResult>> execute(
        const validation::ValidationReport& report, const ExecutionSettings& settings) const;

private:
    const tools::ToolRegistry& registry_;
};

}  // namespace planloop::runtime
