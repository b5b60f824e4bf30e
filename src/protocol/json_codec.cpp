#include "protocol/json_codec.hpp"

namespace planloop::protocol {

using nlohmann::json;

json tool_spec_to_json(const ToolSpec& spec) {
    json payload;
    payload["name"] = spec.name;
    payload["description"] = spec.description;
    payload["required_inputs"] = json::array();
    for (const auto& key : spec.required_inputs) {
        payload["required_inputs"].push_back(key);
    }
    payload["output_schema"] =
        spec.output_schema.has_value() ? json(spec.output_schema.value()) : json(nullptr);
    payload["read_only"] = spec.read_only;
    return payload;
}

json plan_to_json(const Plan& plan) {
    json steps = json::array();
    for (const auto& step : plan.steps) {
        json entry;
        entry["index"] = step.index;
        if (const auto* tool = step.tool()) {
            entry["type"] = "tool";
            entry["tool"] = tool->tool_name;
            entry["inputs"] = json::object();
            for (const auto& [key, value] : tool->inputs) {
                entry["inputs"][key] = value;
            }
            if (!tool->rationale.empty()) {
                entry["rationale"] = tool->rationale;
            }
        } else if (const auto* info = step.info()) {
            entry["type"] = "info";
            entry["text"] = info->text;
        }
        steps.push_back(entry);
    }

    json payload;
    payload["attempt_index"] = plan.provenance.attempt_index;
    payload["source"] = to_string(plan.provenance.source);
    payload["plan"] = steps;
    return payload;
}

json diagnostic_to_json(const Diagnostic& diagnostic) {
    json payload;
    payload["kind"] = to_string(diagnostic.kind);
    payload["step_index"] = diagnostic.step_index;
    payload["message"] = diagnostic.message;
    payload["subject"] = diagnostic.subject;
    return payload;
}

json simulation_to_json(const SimulationResult& simulation) {
    json payload;
    payload["step_index"] = simulation.step_index;
    payload["tool"] = simulation.tool_name;
    payload["predicted_effect"] = simulation.predicted_effect;
    payload["read_only"] = simulation.read_only;
    payload["risk_flag"] = simulation.risk_flag;
    payload["risk_reason"] = simulation.risk_reason;
    return payload;
}

json execution_to_json(const ExecutionResult& execution) {
    json payload;
    payload["step_index"] = execution.step_index;
    payload["tool"] = execution.tool_name;
    payload["info_step"] = execution.info_step;
    payload["exit_status"] = execution.exit_status;
    payload["signal"] = execution.term_signal.has_value()
                            ? json(execution.term_signal.value())
                            : json(nullptr);
    payload["stdout"] = execution.stdout_text;
    payload["stderr"] = execution.stderr_text;
    payload["fault"] =
        execution.fault.has_value() ? json(execution.fault.value()) : json(nullptr);
    payload["success"] = execution.success();
    payload["duration_ms"] = execution.duration_ms;
    return payload;
}

json feedback_to_json(const Feedback& feedback) {
    json payload;
    payload["goal"] = feedback.goal;
    payload["plan_attempt_index"] = feedback.plan_attempt_index;
    payload["outcome"] = to_string(feedback.outcome);
    payload["succeeded"] = feedback.succeeded;
    payload["narrative_summary"] = feedback.narrative_summary;

    payload["diagnostics"] = json::array();
    for (const auto& diagnostic : feedback.diagnostics) {
        payload["diagnostics"].push_back(diagnostic_to_json(diagnostic));
    }
    payload["simulation_results"] = json::array();
    for (const auto& simulation : feedback.simulation_results) {
        payload["simulation_results"].push_back(simulation_to_json(simulation));
    }
    payload["execution_results"] = json::array();
    for (const auto& execution : feedback.execution_results) {
        payload["execution_results"].push_back(execution_to_json(execution));
    }
    return payload;
}

json feedback_list_to_json(const std::vector<Feedback>& entries) {
    json payload = json::array();
    for (const auto& entry : entries) {
        payload.push_back(feedback_to_json(entry));
    }
    return payload;
}

}  // namespace planloop::protocol
