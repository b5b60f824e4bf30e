#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/lifecycle_errors.hpp"
#include "runtime/lifecycle_orchestrator.hpp"

namespace planloop::session {

enum class RunState {
    Created,
    Running,
    Succeeded,
    Failed
};

struct RunRecord {
    std::string run_id;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    std::shared_future<runtime::RunOutcome> outcome;
};

// Runs lifecycles on worker threads so an interactive caller is not
// blocked. Completion is delivered through the future behind wait().
class RunManager {
public:
    // Receives the run id allocated for it.
    using RunJob = std::function<runtime::RunOutcome(const std::string& run_id)>;

    RunManager() = default;
    RunManager(const RunManager&) = delete;
    RunManager& operator=(const RunManager&) = delete;
    // Blocks until every started run has finished.
    ~RunManager();

    core::errors::Result<std::string> start_run(RunJob job);
    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;

    // Blocks until the run finishes.
    core::errors::Result<runtime::RunOutcome> wait(const std::string& run_id) const;

    std::size_t run_count() const;

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
};

}  // namespace planloop::session
