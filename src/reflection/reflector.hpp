#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/diagnostic.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/feedback.hpp"
#include "protocol/plan.hpp"
#include "session/run_log.hpp"

namespace planloop::reflection {

// What happened during one attempt, as handed to the reflector.
struct AttemptRecord {
    std::uint32_t attempt_index = 0;
    protocol::AttemptOutcome outcome = protocol::AttemptOutcome::Executed;
    // Empty steps on a parse failure.
    protocol::Plan plan;
    std::vector<protocol::Diagnostic> diagnostics;
    std::vector<protocol::SimulationResult> simulations;
    std::vector<protocol::ExecutionResult> executions;
    // Set for ParseFailure.
    std::optional<core::errors::LifecycleError> parse_error;
};

// True when the plan passed validation and every tool step has a
// successful ExecutionResult. An empty plan counts as success.
bool attempt_succeeded(const AttemptRecord& record);

// Template-based synthesis of an attempt into Feedback. The narrative is
// meant to be passed verbatim to the next planning attempt.
class Reflector {
public:
    explicit Reflector(std::string goal);

    protocol::Feedback summarize(const AttemptRecord& record) const;

    // summarize() and append the result to run_log.
    core::errors::Result<protocol::Feedback> reflect(const AttemptRecord& record,
                                                     session::RunLog& run_log) const;

private:
    std::string goal_;
};

}  // namespace planloop::reflection
