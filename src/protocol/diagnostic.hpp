#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace planloop::protocol {

enum class DiagnosticKind {
    UnknownTool,
    MissingInput,
    PlaceholderDetected,
    MalformedStep
};

struct Diagnostic {
    DiagnosticKind kind;
    std::size_t step_index = 0;
    std::string message;
    // The offending tool name, input key or placeholder token.
    std::string subject;

    bool operator==(const Diagnostic& other) const {
        return kind == other.kind && step_index == other.step_index &&
               message == other.message && subject == other.subject;
    }
};

// Placeholders are only looked for in tool inputs, so every kind that can
// be produced stops the plan from reaching the simulator and executor.
inline bool is_blocking(const DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UnknownTool:
        case DiagnosticKind::MissingInput:
        case DiagnosticKind::PlaceholderDetected:
        case DiagnosticKind::MalformedStep:
            return true;
        default:
            return false;
    }
}

inline bool has_blocking(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return is_blocking(d.kind); });
}

inline std::string to_string(const DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UnknownTool:
            return "unknown_tool";
        case DiagnosticKind::MissingInput:
            return "missing_input";
        case DiagnosticKind::PlaceholderDetected:
            return "placeholder_detected";
        case DiagnosticKind::MalformedStep:
            return "malformed_step";
        default:
            return "unknown";
    }
}

}  // namespace planloop::protocol
