#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "protocol/diagnostic.hpp"
#include "protocol/tool_contract.hpp"

namespace planloop::protocol {

struct Goal {
    std::string text;
};

struct ToolStep {
    std::string tool_name;
    ToolInputs inputs;
    std::string rationale;

    bool operator==(const ToolStep& other) const {
        return tool_name == other.tool_name && inputs == other.inputs &&
               rationale == other.rationale;
    }
};

struct InfoStep {
    std::string text;

    bool operator==(const InfoStep& other) const { return text == other.text; }
};

using StepBody = std::variant<ToolStep, InfoStep>;

// index is the position in the candidate payload, so it stays stable
// even when malformed neighbours were dropped during parsing.
struct PlanStep {
    std::size_t index = 0;
    StepBody body;

    bool is_tool() const { return std::holds_alternative<ToolStep>(body); }
    const ToolStep* tool() const { return std::get_if<ToolStep>(&body); }
    const InfoStep* info() const { return std::get_if<InfoStep>(&body); }

    bool operator==(const PlanStep& other) const {
        return index == other.index && body == other.body;
    }
};

enum class PlanSource {
    Planner,
    Replanner
};

struct PlanProvenance {
    std::uint32_t attempt_index = 1;
    PlanSource source = PlanSource::Planner;
};

struct Plan {
    std::vector<PlanStep> steps;
    PlanProvenance provenance;
    // MalformedStep findings for payload entries that did not become steps,
    // ordered by step index.
    std::vector<Diagnostic> rejected_steps;

    std::size_t tool_step_count() const {
        std::size_t count = 0;
        for (const auto& step : steps) {
            if (step.is_tool()) {
                ++count;
            }
        }
        return count;
    }
};

inline std::string to_string(const PlanSource source) {
    switch (source) {
        case PlanSource::Planner:
            return "planner";
        case PlanSource::Replanner:
            return "replanner";
        default:
            return "unknown";
    }
}

}  // namespace planloop::protocol
