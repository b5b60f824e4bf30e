#include "planning/planner_oracle.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/config/lifecycle_config.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "tools/process_runner.hpp"

namespace planloop::planning {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using nlohmann::json;

json planning_context_to_json(const PlanningRequest& request) {
    json payload;
    payload["goal"] = request.goal;
    payload["attempt_index"] = request.attempt_index;
    payload["replanning"] = request.replanning;
    payload["tools"] = json::array();
    for (const auto& spec : request.tools) {
        payload["tools"].push_back(protocol::tool_spec_to_json(spec));
    }
    payload["run_log"] = protocol::feedback_list_to_json(request.run_log);
    payload["latest_feedback"] = request.run_log.empty()
                                     ? json(nullptr)
                                     : json(request.run_log.back().narrative_summary);
    return payload;
}

ScriptedOracle::ScriptedOracle(std::vector<std::string> responses)
    : responses_(std::move(responses)) {}

core::errors::Result<std::shared_ptr<ScriptedOracle>> ScriptedOracle::from_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LifecycleError{ErrorCategory::Input,
                              "Unable to open responses file: " + path.string(),
                              "responses_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return LifecycleError{ErrorCategory::Input,
                              "Responses file must hold a JSON array of strings.",
                              "invalid_responses_file"};
    }
    std::vector<std::string> responses;
    for (const auto& entry : document) {
        if (!entry.is_string()) {
            return LifecycleError{ErrorCategory::Input,
                                  "Responses file must hold a JSON array of strings.",
                                  "invalid_responses_file"};
        }
        responses.push_back(entry.get<std::string>());
    }
    return std::make_shared<ScriptedOracle>(std::move(responses));
}

core::errors::Result<std::string> ScriptedOracle::propose(const PlanningRequest& request) {
    requests_.push_back(request);
    if (next_ >= responses_.size()) {
        return LifecycleError{ErrorCategory::Parse,
                              "No scripted response left for attempt " +
                                  std::to_string(request.attempt_index),
                              "oracle_exhausted"};
    }
    return responses_[next_++];
}

CommandOracle::CommandOracle(std::string command, std::filesystem::path working_directory,
                             std::filesystem::path scratch_directory)
    : command_(std::move(command)),
      working_directory_(std::move(working_directory)),
      scratch_directory_(std::move(scratch_directory)) {}

core::errors::Result<std::string> CommandOracle::propose(const PlanningRequest& request) {
    std::error_code ec;
    std::filesystem::create_directories(scratch_directory_, ec);
    if (ec) {
        return LifecycleError{ErrorCategory::Internal,
                              "Unable to create planner scratch directory: " +
                                  scratch_directory_.string(),
                              "scratch_dir_create_failed"};
    }

    const auto context_file =
        scratch_directory_ / ("planning_context_" + core::config::generate_run_id() + ".json");
    {
        std::ofstream out(context_file);
        if (!out.is_open()) {
            return LifecycleError{ErrorCategory::Internal,
                                  "Unable to open planning context file: " +
                                      context_file.string(),
                                  "context_open_failed"};
        }
        out << planning_context_to_json(request).dump(2);
        if (!out.good()) {
            return LifecycleError{ErrorCategory::Internal,
                                  "Unable to write planning context file: " +
                                      context_file.string(),
                                  "context_write_failed"};
        }
    }

    const std::string command =
        "export PLANLOOP_CONTEXT_FILE=" + tools::shell_quote(context_file.string()) + "; " +
        command_;
    LOG_DEBUG("CommandOracle: attempt " + std::to_string(request.attempt_index) +
              " running planner command");
    auto capture_result = tools::run_process(
        tools::shell_request(command, working_directory_, request.timeout_ms));
    std::filesystem::remove(context_file, ec);

    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return LifecycleError{ErrorCategory::Deadline,
                              "Planner command exceeded its deadline of " +
                                  std::to_string(request.timeout_ms) + " ms",
                              "deadline_exceeded"};
    }
    if (capture.exit_code != 0) {
        return LifecycleError{ErrorCategory::Parse,
                              "Planner command failed with exit code " +
                                  std::to_string(capture.exit_code) + ": " +
                                  capture.stderr_text,
                              "planner_command_failed"};
    }
    return capture.stdout_text;
}

}  // namespace planloop::planning
