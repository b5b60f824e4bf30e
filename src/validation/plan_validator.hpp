#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/diagnostic.hpp"
#include "protocol/plan.hpp"
#include "tools/tool_registry.hpp"

namespace planloop::validation {

// Best-effort parse of a candidate plan plus everything wrong with it.
// `plan` holds the steps that could be understood even when diagnostics
// are present, so callers can show what the planner meant.
struct ValidationReport {
    protocol::Plan plan;
    std::vector<protocol::Diagnostic> diagnostics;

    bool executable() const { return !protocol::has_blocking(diagnostics); }
};

class PlanValidator {
public:
    explicit PlanValidator(const tools::ToolRegistry& registry);

    // payload is the {"plan": [...]} object returned by the extractor.
    // Per step the checks run in this order: structure, tool existence,
    // required inputs, placeholders.
    ValidationReport validate(const nlohmann::json& payload,
                              const protocol::PlanProvenance& provenance) const;

    // Re-runs the checks on an already parsed plan. Structural findings
    // recorded for dropped entries are merged back in step order, so the
    // result equals the diagnostics validate() produced for the payload.
    std::vector<protocol::Diagnostic> revalidate(const protocol::Plan& plan) const;

private:
    void check_tool_step(const protocol::ToolStep& step, std::size_t index,
                         std::vector<protocol::Diagnostic>& diagnostics) const;

    const tools::ToolRegistry& registry_;
};

}  // namespace planloop::validation
