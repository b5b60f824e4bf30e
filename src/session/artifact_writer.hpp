#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/feedback.hpp"
#include "protocol/run_request.hpp"
#include "runtime/lifecycle_orchestrator.hpp"

namespace planloop::session {

// Appends one JSON object per line to <workspace>/<subdir>/<run_id>.jsonl.
// Safe to share between the run worker and the thread that waits on it.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path artifact_subdir = ".planloop_runs");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_feedback(
        const std::string& run_id, const protocol::Feedback& feedback) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, const runtime::RunOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> run_log_path(
        const std::string& run_id) const;

private:
    // Both expect mutex_ to be held.
    core::errors::Result<std::filesystem::path> artifact_dir() const;
    core::errors::Result<std::filesystem::path> log_path_locked(const std::string& run_id) const;

    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_name,
        const nlohmann::json& payload) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path artifact_subdir_;
    mutable std::mutex mutex_;
    mutable std::optional<std::filesystem::path> artifact_dir_;
};

}  // namespace planloop::session
