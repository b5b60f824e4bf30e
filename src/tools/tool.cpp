#include "tools/tool.hpp"

#include <sstream>

namespace planloop::tools {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;

namespace {

std::string clip(const std::string& value) {
    constexpr std::size_t kMaxValueLength = 80;
    if (value.size() <= kMaxValueLength) {
        return value;
    }
    return value.substr(0, kMaxValueLength) + "...";
}

}  // namespace

std::string describe_invocation(const protocol::ToolSpec& spec,
                                const protocol::ToolInputs& inputs) {
    std::ostringstream out;
    out << (spec.read_only ? "read-only" : "state-changing") << " call to "
        << spec.name;
    if (!inputs.empty()) {
        out << " with";
        bool first = true;
        for (const auto& [key, value] : inputs) {
            out << (first ? " " : ", ") << key << "=\"" << clip(value) << "\"";
            first = false;
        }
    }
    if (spec.output_schema.has_value()) {
        out << "; yields " << spec.output_schema.value();
    }
    return out.str();
}

core::errors::Result<std::string> Tool::predict(
    const protocol::ToolInputs& inputs) const {
    for (const auto& key : required_inputs()) {
        const auto it = inputs.find(key);
        if (it == inputs.end() || it->second.empty()) {
            return LifecycleError{ErrorCategory::Execution,
                                  "Cannot predict " + name() +
                                      " without input '" + key + "'",
                                  "prediction_failed"};
        }
    }
    return describe_invocation(spec(), inputs);
}

}  // namespace planloop::tools
