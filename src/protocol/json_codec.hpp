#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/diagnostic.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/feedback.hpp"
#include "protocol/plan.hpp"
#include "protocol/tool_contract.hpp"

namespace planloop::protocol {

// Serialized shapes shared by the run artifacts and the planning context
// handed to external planners.
nlohmann::json tool_spec_to_json(const ToolSpec& spec);
nlohmann::json plan_to_json(const Plan& plan);
nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic);
nlohmann::json simulation_to_json(const SimulationResult& simulation);
nlohmann::json execution_to_json(const ExecutionResult& execution);
nlohmann::json feedback_to_json(const Feedback& feedback);
nlohmann::json feedback_list_to_json(const std::vector<Feedback>& entries);

}  // namespace planloop::protocol
