#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool.hpp"
#include "tools/tool_registry.hpp"

namespace planloop::tools {

// `git status` in the working directory. No inputs.
class GitStatusTool : public Tool {
public:
    GitStatusTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;

private:
    protocol::ToolSpec spec_;
};

// Runs `command` through /bin/sh -c.
class RunCommandTool : public Tool {
public:
    RunCommandTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;

private:
    protocol::ToolSpec spec_;
};

class ReadFileTool : public Tool {
public:
    ReadFileTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;

private:
    protocol::ToolSpec spec_;
};

// Replaces the file at `path` with `content`, creating parent directories.
class WriteFileTool : public Tool {
public:
    WriteFileTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;

private:
    protocol::ToolSpec spec_;
};

// Applies a unified diff with `patch -p1`.
class ApplyPatchTool : public Tool {
public:
    ApplyPatchTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;
    core::errors::Result<std::string> predict(
        const protocol::ToolInputs& inputs) const override;

private:
    protocol::ToolSpec spec_;
};

class EchoTool : public Tool {
public:
    EchoTool();
    const protocol::ToolSpec& spec() const override { return spec_; }
    core::errors::Result<protocol::ToolOutcome> execute(
        const protocol::ToolInputs& inputs, const ToolContext& context) override;

private:
    protocol::ToolSpec spec_;
};

std::vector<std::shared_ptr<Tool>> make_builtin_tools();

core::errors::Status register_builtin_tools(ToolRegistry& registry);

// File paths named in the ---/+++ headers of a unified diff, without the
// a/ b/ prefixes.
std::vector<std::string> extract_patch_paths(const std::string& patch_text);

}  // namespace planloop::tools
