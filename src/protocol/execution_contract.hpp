#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace planloop::protocol {

struct SimulationResult {
    std::size_t step_index = 0;
    std::string tool_name;
    std::string predicted_effect;
    bool read_only = false;
    // Prediction failed or the tool is missing. Advisory only.
    bool risk_flag = false;
    std::string risk_reason;
};

struct ExecutionResult {
    std::size_t step_index = 0;
    std::string tool_name;  // empty for info steps
    bool info_step = false;
    int exit_status = -1;
    std::optional<int> term_signal;
    std::string stdout_text;
    std::string stderr_text;
    // The tool could not be invoked or the attempt deadline elapsed.
    std::optional<std::string> fault;
    double duration_ms = 0.0;

    // Only the exit status decides; a clean return from the tool is not
    // enough on its own.
    bool success() const {
        return !fault.has_value() && !term_signal.has_value() && exit_status == 0;
    }

    std::string status_text() const {
        if (fault.has_value()) {
            return "fault: " + fault.value();
        }
        if (term_signal.has_value()) {
            return "signal " + std::to_string(term_signal.value());
        }
        return "exit " + std::to_string(exit_status);
    }
};

}  // namespace planloop::protocol
