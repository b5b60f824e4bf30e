#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace planloop::tools {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;

core::errors::Status ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        return LifecycleError{ErrorCategory::Registry, "Cannot register a null tool.",
                              "invalid_tool"};
    }
    const std::string name = tool->name();
    if (name.empty()) {
        return LifecycleError{ErrorCategory::Registry,
                              "Cannot register a tool without a name.",
                              "invalid_tool"};
    }
    if (index_by_name_.find(name) != index_by_name_.end()) {
        return LifecycleError{ErrorCategory::Registry,
                              "Tool already registered: " + name, "duplicate_tool",
                              "Each tool name may be registered once."};
    }

    index_by_name_.emplace(name, tools_.size());
    tools_.push_back(std::move(tool));
    LOG_DEBUG("ToolRegistry: registered " + name);
    return core::errors::ok();
}

std::optional<protocol::ToolSpec> ToolRegistry::lookup(const std::string& name) const {
    const auto it = index_by_name_.find(name);
    if (it == index_by_name_.end()) {
        return std::nullopt;
    }
    return tools_[it->second]->spec();
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
    const auto it = index_by_name_.find(name);
    if (it == index_by_name_.end()) {
        return nullptr;
    }
    return tools_[it->second];
}

std::vector<protocol::ToolSpec> ToolRegistry::all() const {
    std::vector<protocol::ToolSpec> specs;
    specs.reserve(tools_.size());
    for (const auto& tool : tools_) {
        specs.push_back(tool->spec());
    }
    return specs;
}

}  // namespace planloop::tools
