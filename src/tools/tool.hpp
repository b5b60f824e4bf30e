#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace planloop::tools {

struct ToolContext {
    std::filesystem::path working_directory = ".";
    // Remaining budget for this invocation. Tools that spawn processes
    // kill them when it runs out.
    std::uint32_t timeout_ms = 30000;
};

// A capability the executor can invoke. Implementations are registered
// once in a ToolRegistry and looked up by name.
class Tool {
public:
    virtual ~Tool() = default;

    virtual const protocol::ToolSpec& spec() const = 0;

    const std::string& name() const { return spec().name; }
    const std::set<std::string>& required_inputs() const {
        return spec().required_inputs;
    }

    // An error means the tool could not be invoked at all. A tool that ran
    // and failed returns an outcome with a non-zero exit status.
    virtual core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) = 0;

    // Describes what execute() would do. Must not spawn processes or touch
    // the filesystem.
    virtual core::errors::Result<std::string> predict(
        const protocol::ToolInputs& inputs) const;
};

std::string describe_invocation(const protocol::ToolSpec& spec,
                                const protocol::ToolInputs& inputs);

}  // namespace planloop::tools
