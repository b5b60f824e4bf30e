#include "session/run_manager.hpp"

#include <exception>
#include <utility>
#include <vector>
#include "core/config/lifecycle_config.hpp"
#include "core/logging/logger.hpp"

namespace planloop::session {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;

RunManager::~RunManager() {
    std::vector<std::shared_future<runtime::RunOutcome>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [run_id, record] : runs_) {
            if (record.outcome.valid()) {
                pending.push_back(record.outcome);
            }
        }
    }
    for (const auto& future : pending) {
        future.wait();
    }
}

bool RunManager::is_terminal(const RunState state) {
    return state == RunState::Succeeded || state == RunState::Failed;
}

std::string RunManager::to_string(const RunState state) {
    switch (state) {
        case RunState::Created:
            return "created";
        case RunState::Running:
            return "running";
        case RunState::Succeeded:
            return "succeeded";
        case RunState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> RunManager::start_run(RunJob job) {
    if (!job) {
        return LifecycleError{ErrorCategory::Input, "Run job cannot be empty.",
                              "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxIdAttempts = 16;
    for (int id_attempt = 0; id_attempt < kMaxIdAttempts; ++id_attempt) {
        const std::string run_id = core::config::generate_run_id();
        if (runs_.find(run_id) != runs_.end()) {
            continue;
        }

        RunRecord record;
        record.run_id = run_id;
        record.state = RunState::Created;
        auto& stored = runs_.emplace(run_id, std::move(record)).first->second;
        LOG_INFO("RunManager: run " + run_id + " transition created -> running");
        stored.state = RunState::Running;

        // The worker takes the lock to record its terminal state, so it
        // cannot observe the record before the future is stored below.
        stored.outcome =
            std::async(std::launch::async, [this, run_id, job = std::move(job)]() {
                runtime::RunOutcome outcome;
                try {
                    outcome = job(run_id);
                } catch (const std::exception& ex) {
                    outcome = runtime::RunOutcome{};
                    outcome.status = runtime::RunStatus::Failed;
                    outcome.failure = LifecycleError{ErrorCategory::Internal,
                                                     std::string("run job threw: ") + ex.what(),
                                                     "run_job_threw"};
                    LOG_ERROR("RunManager: run " + run_id + " job threw: " + ex.what());
                }
                const bool succeeded = outcome.status == runtime::RunStatus::Succeeded;
                std::optional<std::string> reason;
                if (outcome.failure.has_value()) {
                    reason = outcome.failure->message;
                }
                auto moved = transition_to_terminal(
                    run_id, succeeded ? RunState::Succeeded : RunState::Failed, reason);
                if (core::errors::is_error(moved)) {
                    const auto& err = core::errors::get_error(moved);
                    LOG_ERROR("RunManager: [" + err.code + "]: " + err.message);
                }
                return outcome;
            }).share();
        return run_id;
    }

    return LifecycleError{ErrorCategory::Internal, "Unable to allocate unique run ID.",
                          "run_id_generation_failed"};
}

core::errors::Result<RunState> RunManager::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return LifecycleError{ErrorCategory::Input, "Run ID not found: " + run_id,
                              "run_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return LifecycleError{ErrorCategory::Input,
                              "Run is already terminal: " + to_string(it->second.state),
                              "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_INFO("RunManager: run " + run_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<RunState> RunManager::get_run_state(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return LifecycleError{ErrorCategory::Input, "Run ID not found: " + run_id,
                              "run_not_found"};
    }
    return it->second.state;
}

core::errors::Result<runtime::RunOutcome> RunManager::wait(const std::string& run_id) const {
    std::shared_future<runtime::RunOutcome> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(run_id);
        if (it == runs_.end()) {
            return LifecycleError{ErrorCategory::Input, "Run ID not found: " + run_id,
                                  "run_not_found"};
        }
        future = it->second.outcome;
    }
    return future.get();
}

std::size_t RunManager::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

}  // namespace planloop::session
