#include "tools/builtin_tools.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>
#include "core/config/lifecycle_config.hpp"
#include "tools/process_runner.hpp"

namespace planloop::tools {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using protocol::ToolInputs;
using protocol::ToolOutcome;
using protocol::ToolSpec;

namespace {

ToolSpec make_spec(std::string name, std::set<std::string> required,
                   std::string description, std::string output_schema,
                   const bool read_only) {
    ToolSpec spec;
    spec.name = std::move(name);
    spec.required_inputs = std::move(required);
    spec.description = std::move(description);
    spec.output_schema = std::move(output_schema);
    spec.read_only = read_only;
    return spec;
}

const std::string& input_or_empty(const ToolInputs& inputs, const std::string& key) {
    static const std::string kEmpty;
    const auto it = inputs.find(key);
    return it == inputs.end() ? kEmpty : it->second;
}

ToolOutcome failed_outcome(const int exit_status, const std::string& message) {
    ToolOutcome outcome;
    outcome.exit_status = exit_status;
    outcome.stderr_text = message;
    return outcome;
}

core::errors::Result<ToolOutcome> run_as_tool(const std::string& tool_name,
                                              const ProcessRequest& request) {
    auto capture_result = run_process(request);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return LifecycleError{ErrorCategory::Deadline,
                              tool_name + " exceeded its deadline of " +
                                  std::to_string(request.timeout_ms) + " ms",
                              "deadline_exceeded"};
    }

    ToolOutcome outcome;
    outcome.exit_status = capture.exit_code;
    outcome.term_signal = capture.term_signal;
    outcome.stdout_text = capture.stdout_text;
    outcome.stderr_text = capture.stderr_text;
    return outcome;
}

std::filesystem::path resolve(const ToolContext& context, const std::string& path) {
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }
    return context.working_directory / candidate;
}

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

}  // namespace

GitStatusTool::GitStatusTool()
    : spec_(make_spec("git_status", {}, "Shows the working tree status of the repository.",
                      "text: branch and changed files", true)) {}

core::errors::Result<ToolOutcome> GitStatusTool::execute(const ToolInputs& /*inputs*/,
                                                         const ToolContext& context) {
    ProcessRequest request;
    request.argv = {"git", "status"};
    request.working_directory = context.working_directory;
    request.timeout_ms = context.timeout_ms;
    return run_as_tool(spec_.name, request);
}

RunCommandTool::RunCommandTool()
    : spec_(make_spec("run_command", {"command"},
                      "Runs a shell command and captures stdout and stderr.",
                      "text: command output", false)) {}

core::errors::Result<ToolOutcome> RunCommandTool::execute(const ToolInputs& inputs,
                                                          const ToolContext& context) {
    return run_as_tool(spec_.name,
                       shell_request(input_or_empty(inputs, "command"),
                                     context.working_directory, context.timeout_ms));
}

ReadFileTool::ReadFileTool()
    : spec_(make_spec("read_file", {"path"}, "Reads a text file.",
                      "text: file contents", true)) {}

core::errors::Result<ToolOutcome> ReadFileTool::execute(const ToolInputs& inputs,
                                                        const ToolContext& context) {
    const auto file_path = resolve(context, input_or_empty(inputs, "path"));

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return failed_outcome(1, "File does not exist: " + file_path.string());
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return failed_outcome(1, "Path is not a regular file: " + file_path.string());
    }
    if (is_probably_binary(file_path)) {
        return failed_outcome(1, "Refusing to read binary file: " + file_path.string());
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return failed_outcome(1, "Failed to open file: " + file_path.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return failed_outcome(1, "I/O error while reading file: " + file_path.string());
    }

    ToolOutcome outcome;
    outcome.exit_status = 0;
    outcome.stdout_text = buffer.str();
    return outcome;
}

WriteFileTool::WriteFileTool()
    : spec_(make_spec("write_file", {"path", "content"},
                      "Writes content to a file, replacing what was there.",
                      "text: number of bytes written", false)) {}

core::errors::Result<ToolOutcome> WriteFileTool::execute(const ToolInputs& inputs,
                                                         const ToolContext& context) {
    const auto file_path = resolve(context, input_or_empty(inputs, "path"));
    const auto& content = input_or_empty(inputs, "content");

    std::error_code ec;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            return failed_outcome(1, "Unable to create directory: " +
                                         file_path.parent_path().string());
        }
    }

    std::ofstream out(file_path, std::ios::trunc);
    if (!out.is_open()) {
        return failed_outcome(1, "Failed to open file for writing: " + file_path.string());
    }
    out << content;
    if (!out.good()) {
        return failed_outcome(1, "Failed to write file: " + file_path.string());
    }

    ToolOutcome outcome;
    outcome.exit_status = 0;
    outcome.stdout_text = "wrote " + std::to_string(content.size()) + " bytes to " +
                          file_path.string();
    return outcome;
}

ApplyPatchTool::ApplyPatchTool()
    : spec_(make_spec("apply_patch", {"patch"},
                      "Applies a unified diff to files in the working directory.",
                      "text: patch(1) report", false)) {}

core::errors::Result<std::string> ApplyPatchTool::predict(const ToolInputs& inputs) const {
    const auto paths = extract_patch_paths(input_or_empty(inputs, "patch"));
    if (paths.empty()) {
        return LifecycleError{ErrorCategory::Execution,
                              "Patch does not include any file paths.",
                              "prediction_failed"};
    }
    std::string files;
    for (const auto& path : paths) {
        files += (files.empty() ? "" : ", ") + path;
    }
    return "state-changing call to apply_patch; modifies " + files;
}

core::errors::Result<ToolOutcome> ApplyPatchTool::execute(const ToolInputs& inputs,
                                                          const ToolContext& context) {
    const auto& patch_text = input_or_empty(inputs, "patch");
    if (extract_patch_paths(patch_text).empty()) {
        return failed_outcome(2, "Patch does not include any file paths.");
    }

    std::error_code ec;
    const auto temp_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return LifecycleError{ErrorCategory::Internal,
                              "No temporary directory for patch file.",
                              "patch_temp_dir_failed"};
    }
    const auto patch_file =
        temp_dir / ("planloop_patch_" + core::config::generate_run_id() + ".diff");
    {
        std::ofstream out(patch_file);
        if (!out.is_open()) {
            return LifecycleError{ErrorCategory::Internal,
                                  "Failed to open temporary patch file: " +
                                      patch_file.string(),
                                  "patch_temp_open_failed"};
        }
        out << patch_text;
        if (!out.good()) {
            return LifecycleError{ErrorCategory::Internal,
                                  "Failed to write temporary patch file: " +
                                      patch_file.string(),
                                  "patch_temp_write_failed"};
        }
    }

    ProcessRequest request;
    request.argv = {"patch", "-p1", "--forward", "--batch", "-i", patch_file.string()};
    request.working_directory = context.working_directory;
    request.timeout_ms = context.timeout_ms;
    auto outcome = run_as_tool(spec_.name, request);

    std::filesystem::remove(patch_file, ec);
    return outcome;
}

EchoTool::EchoTool()
    : spec_(make_spec("echo", {"text"}, "Echoes the input back.", "text: echoed input",
                      true)) {}

core::errors::Result<ToolOutcome> EchoTool::execute(const ToolInputs& inputs,
                                                    const ToolContext& /*context*/) {
    ToolOutcome outcome;
    outcome.exit_status = 0;
    outcome.stdout_text = "Echoed: " + input_or_empty(inputs, "text");
    return outcome;
}

std::vector<std::shared_ptr<Tool>> make_builtin_tools() {
    return {std::make_shared<GitStatusTool>(), std::make_shared<RunCommandTool>(),
            std::make_shared<ReadFileTool>(),  std::make_shared<WriteFileTool>(),
            std::make_shared<ApplyPatchTool>(), std::make_shared<EchoTool>()};
}

core::errors::Status register_builtin_tools(ToolRegistry& registry) {
    for (auto& tool : make_builtin_tools()) {
        auto registered = registry.register_tool(tool);
        if (core::errors::is_error(registered)) {
            return registered;
        }
    }
    return core::errors::ok();
}

std::vector<std::string> extract_patch_paths(const std::string& patch_text) {
    std::istringstream in(patch_text);
    std::string line;
    std::unordered_set<std::string> dedupe;
    std::vector<std::string> paths;

    while (std::getline(in, line)) {
        if (!(line.rfind("+++ ", 0) == 0 || line.rfind("--- ", 0) == 0)) {
            continue;
        }
        std::string candidate = line.substr(4);
        if (candidate == "/dev/null") {
            continue;
        }

        const auto tab_pos = candidate.find('\t');
        if (tab_pos != std::string::npos) {
            candidate = candidate.substr(0, tab_pos);
        }

        if (candidate.rfind("a/", 0) == 0 || candidate.rfind("b/", 0) == 0) {
            candidate = candidate.substr(2);
        }

        if (candidate.empty()) {
            continue;
        }
        if (dedupe.insert(candidate).second) {
            paths.push_back(candidate);
        }
    }
    return paths;
}

}  // namespace planloop::tools
