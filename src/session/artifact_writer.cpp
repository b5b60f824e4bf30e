#include "session/artifact_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace planloop::session {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::RunRequest& request) {
    json payload;
    payload["goal"] = request.goal;
    payload["working_directory"] = request.working_directory.string();
    payload["verbose"] = request.verbose;
    payload["responses_file"] =
        request.responses_file.has_value() ? request.responses_file->string() : "";
    payload["planner_command"] = request.planner_command.value_or("");
    payload["replanner_command"] = request.replanner_command.value_or("");
    payload["config_file"] =
        request.config_file.has_value() ? request.config_file->string() : "";
    if (request.max_attempts.has_value()) {
        payload["max_attempts"] = request.max_attempts.value();
    } else {
        payload["max_attempts"] = nullptr;
    }
    return payload;
}

json transitions_to_json(const std::vector<runtime::Transition>& transitions) {
    json out = json::array();
    for (const auto& transition : transitions) {
        out.push_back({{"attempt", transition.attempt_index},
                       {"from", runtime::to_string(transition.from)},
                       {"to", runtime::to_string(transition.to)}});
    }
    return out;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path artifact_subdir)
    : workspace_root_(std::move(workspace_root)),
      artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::artifact_dir() const {
    if (artifact_dir_.has_value()) {
        return artifact_dir_.value();
    }

    // Run logs always live below the workspace they describe.
    const auto subdir = artifact_subdir_.lexically_normal();
    if (subdir.empty() || subdir.is_absolute() || subdir.begin()->string() == "..") {
        return LifecycleError{ErrorCategory::Input,
                              "Artifact subdirectory must be relative to the workspace: " +
                                  artifact_subdir_.string(),
                              "invalid_artifact_subdir"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return LifecycleError{ErrorCategory::Input,
                              "Workspace root is not an existing directory: " +
                                  workspace_root_.string(),
                              "invalid_workspace_root"};
    }
    const auto dir = std::filesystem::canonical(workspace_root_, ec) / subdir;
    if (!ec) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        return LifecycleError{ErrorCategory::Internal,
                              "Unable to create artifacts directory: " + dir.string(),
                              "artifact_dir_create_failed"};
    }
    artifact_dir_ = dir;
    return dir;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_log_path(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_path_locked(run_id);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::log_path_locked(
    const std::string& run_id) const {
    // The id becomes a file name, so it may not name a directory.
    const std::filesystem::path name(run_id);
    if (run_id.empty() || name.filename() != name || run_id == "." || run_id == "..") {
        return LifecycleError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                              "invalid_run_id"};
    }

    auto dir = artifact_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    return core::errors::get_value(dir) / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_name, const json& payload) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = log_path_locked(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    const json event = {{"ts_unix_ms", now_unix_ms()},
                        {"event", event_name},
                        {"run_id", run_id},
                        {"payload", payload}};

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return LifecycleError{ErrorCategory::Internal,
                              "Unable to open run log: " + path.string(),
                              "artifact_open_failed"};
    }
    out << event.dump() << '\n';
    out.flush();
    if (!out.good()) {
        return LifecycleError{ErrorCategory::Internal,
                              "Unable to append '" + event_name + "' event to " + path.string(),
                              "artifact_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::RunRequest& request) const {
    return append_event(run_id, "request", request_to_json(request));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_feedback(
    const std::string& run_id, const protocol::Feedback& feedback) const {
    return append_event(run_id, "feedback", protocol::feedback_to_json(feedback));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& run_id, const runtime::RunOutcome& outcome) const {
    json payload;
    payload["status"] = runtime::to_string(outcome.status);
    payload["attempts"] = outcome.attempts;
    if (outcome.failure.has_value()) {
        payload["failure_code"] = outcome.failure->code;
        payload["error_message"] = outcome.failure->message;
    } else {
        payload["failure_code"] = "";
        payload["error_message"] = "";
    }
    const auto* latest = outcome.run_log.latest();
    payload["summary"] = latest != nullptr ? latest->narrative_summary : "";
    payload["transitions"] = transitions_to_json(outcome.transitions);
    return append_event(run_id, "final", payload);
}

}  // namespace planloop::session
