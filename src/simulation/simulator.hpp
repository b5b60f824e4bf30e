#pragma once

#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "tools/tool_registry.hpp"
#include "validation/plan_validator.hpp"

namespace planloop::simulation {

// Predicts each tool step's effect through Tool::predict. Nothing is
// executed. A step that cannot be predicted is flagged, not rejected.
class Simulator {
public:
    explicit Simulator(const tools::ToolRegistry& registry);

    // Fails with "plan_not_executable" if the report carries blocking
    // diagnostics.
    core::errors::Result<std::vector<protocol::SimulationResult>> simulate(
        const validation::ValidationReport& report) const;

private:
    const tools::ToolRegistry& registry_;
};

}  // namespace planloop::simulation
