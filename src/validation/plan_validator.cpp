#include "validation/plan_validator.hpp"

#include <optional>
#include <string>
#include <utility>
#include "validation/placeholder_detector.hpp"

namespace planloop::validation {

using nlohmann::json;
using protocol::Diagnostic;
using protocol::DiagnosticKind;
using protocol::InfoStep;
using protocol::PlanStep;
using protocol::ToolInputs;
using protocol::ToolStep;

namespace {

std::string step_prefix(const std::size_t index) {
    return "step " + std::to_string(index) + ": ";
}

Diagnostic malformed(const std::size_t index, const std::string& message) {
    return Diagnostic{DiagnosticKind::MalformedStep, index, step_prefix(index) + message, ""};
}

// The primary field, or its legacy alias when the primary key is absent.
const json* find_field(const json& step, const char* primary, const char* alias) {
    if (step.contains(primary)) {
        return &step.at(primary);
    }
    if (step.contains(alias)) {
        return &step.at(alias);
    }
    return nullptr;
}

std::optional<std::string> scalar_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return std::string();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return std::nullopt;
}

void reject(ValidationReport& report, const Diagnostic& diagnostic) {
    report.plan.rejected_steps.push_back(diagnostic);
    report.diagnostics.push_back(diagnostic);
}

}  // namespace

PlanValidator::PlanValidator(const tools::ToolRegistry& registry) : registry_(registry) {}

ValidationReport PlanValidator::validate(const json& payload,
                                         const protocol::PlanProvenance& provenance) const {
    ValidationReport report;
    report.plan.provenance = provenance;

    if (!payload.is_object() || !payload.contains("plan") || !payload.at("plan").is_array()) {
        reject(report, malformed(0, "payload has no 'plan' array"));
        return report;
    }

    const auto& steps = payload.at("plan");
    for (std::size_t index = 0; index < steps.size(); ++index) {
        const auto& raw = steps.at(index);
        if (!raw.is_object()) {
            reject(report, malformed(index, "step is not an object"));
            continue;
        }
        if (!raw.contains("type") || !raw.at("type").is_string()) {
            reject(report, malformed(index, "step has no string 'type' field"));
            continue;
        }

        const auto type = raw.at("type").get<std::string>();
        if (type == "info") {
            const json* text = find_field(raw, "text", "message");
            if (text == nullptr || !text->is_string()) {
                reject(report, malformed(index, "info step has no 'text' string"));
                continue;
            }
            report.plan.steps.push_back(PlanStep{index, InfoStep{text->get<std::string>()}});
            continue;
        }
        if (type != "tool") {
            reject(report, malformed(index, "unknown step type '" + type +
                                                "', expected 'tool' or 'info'"));
            continue;
        }

        const json* name = find_field(raw, "tool", "name");
        if (name == nullptr || !name->is_string() || name->get<std::string>().empty()) {
            reject(report, malformed(index, "tool step has no 'tool' name"));
            continue;
        }

        ToolStep step;
        step.tool_name = name->get<std::string>();
        if (raw.contains("rationale") && raw.at("rationale").is_string()) {
            step.rationale = raw.at("rationale").get<std::string>();
        }

        bool well_formed = true;
        if (raw.contains("inputs")) {
            const auto& inputs = raw.at("inputs");
            if (inputs.is_object()) {
                for (const auto& item : inputs.items()) {
                    const std::string& key = item.key();
                    const auto text = scalar_to_string(item.value());
                    if (!text.has_value()) {
                        reject(report, malformed(index, "input '" + key +
                                                            "' must be a scalar value"));
                        well_formed = false;
                        break;
                    }
                    step.inputs[key] = text.value();
                }
            } else if (!inputs.is_null()) {
                reject(report, malformed(index, "'inputs' must be an object"));
                well_formed = false;
            }
        } else if (raw.contains("input")) {
            // Older planners send one bare string. It fills the tool's only
            // required input, or "input" when there is no single candidate.
            const auto text = scalar_to_string(raw.at("input"));
            if (!text.has_value()) {
                reject(report, malformed(index, "'input' must be a scalar value"));
                well_formed = false;
            } else {
                std::string key = "input";
                const auto spec = registry_.lookup(step.tool_name);
                if (spec.has_value() && spec->required_inputs.size() == 1) {
                    key = *spec->required_inputs.begin();
                }
                step.inputs[key] = text.value();
            }
        }
        if (!well_formed) {
            continue;
        }

        check_tool_step(step, index, report.diagnostics);
        report.plan.steps.push_back(PlanStep{index, std::move(step)});
    }
    return report;
}

std::vector<Diagnostic> PlanValidator::revalidate(const protocol::Plan& plan) const {
    std::vector<Diagnostic> diagnostics;
    auto rejected = plan.rejected_steps.begin();
    for (const auto& step : plan.steps) {
        while (rejected != plan.rejected_steps.end() && rejected->step_index < step.index) {
            diagnostics.push_back(*rejected++);
        }
        if (const auto* tool = step.tool()) {
            check_tool_step(*tool, step.index, diagnostics);
        }
    }
    diagnostics.insert(diagnostics.end(), rejected, plan.rejected_steps.end());
    return diagnostics;
}

void PlanValidator::check_tool_step(const ToolStep& step, const std::size_t index,
                                    std::vector<Diagnostic>& diagnostics) const {
    const auto spec = registry_.lookup(step.tool_name);
    if (!spec.has_value()) {
        diagnostics.push_back(Diagnostic{DiagnosticKind::UnknownTool, index,
                                         step_prefix(index) + "unknown tool '" +
                                             step.tool_name + "'",
                                         step.tool_name});
    } else {
        for (const auto& key : spec->required_inputs) {
            const auto it = step.inputs.find(key);
            if (it != step.inputs.end() && !it->second.empty()) {
                continue;
            }
            diagnostics.push_back(Diagnostic{DiagnosticKind::MissingInput, index,
                                             step_prefix(index) + "tool '" + step.tool_name +
                                                 "' requires input '" + key + "'",
                                             key});
        }
    }

    for (const auto& [key, value] : step.inputs) {
        const auto match = find_placeholder(value);
        if (!match.has_value()) {
            continue;
        }
        diagnostics.push_back(Diagnostic{DiagnosticKind::PlaceholderDetected, index,
                                         step_prefix(index) + "input '" + key +
                                             "' contains unresolved placeholder '" +
                                             match->token + "'",
                                         match->token});
    }
}

}  // namespace planloop::validation
