#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool.hpp"

namespace planloop::tools {

// Filled once at startup; there is no removal.
class ToolRegistry {
public:
    // Fails with code "duplicate_tool" when the name is already taken.
    core::errors::Status register_tool(std::shared_ptr<Tool> tool);

    std::optional<protocol::ToolSpec> lookup(const std::string& name) const;

    // Live implementation for the executor and simulator.
    std::shared_ptr<Tool> find(const std::string& name) const;

    // Snapshot in registration order.
    std::vector<protocol::ToolSpec> all() const;

    std::size_t size() const { return tools_.size(); }

private:
    std::vector<std::shared_ptr<Tool>> tools_;
    std::unordered_map<std::string, std::size_t> index_by_name_;
};

}  // namespace planloop::tools
