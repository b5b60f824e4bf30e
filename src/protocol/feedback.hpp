#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "protocol/diagnostic.hpp"
#include "protocol/execution_contract.hpp"

namespace planloop::protocol {

enum class AttemptOutcome {
    Executed,      // plan passed validation and the executor ran
    Rejected,      // blocking diagnostics, nothing executed
    ParseFailure   // the planner response held no usable plan
};

struct Feedback {
    std::string goal;
    std::uint32_t plan_attempt_index = 0;
    AttemptOutcome outcome = AttemptOutcome::Executed;
    std::vector<Diagnostic> diagnostics;
    std::vector<SimulationResult> simulation_results;
    std::vector<ExecutionResult> execution_results;
    std::string narrative_summary;
    bool succeeded = false;
};

inline std::string to_string(const AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Executed:
            return "executed";
        case AttemptOutcome::Rejected:
            return "rejected";
        case AttemptOutcome::ParseFailure:
            return "parse_failure";
        default:
            return "unknown";
    }
}

}  // namespace planloop::protocol
