#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/feedback.hpp"
#include "protocol/tool_contract.hpp"

namespace planloop::planning {

// Everything a planner is shown for one attempt.
struct PlanningRequest {
    std::string goal;
    std::uint32_t attempt_index = 1;
    bool replanning = false;
    std::vector<protocol::ToolSpec> tools;
    // Snapshot of the run log up to the previous attempt.
    std::vector<protocol::Feedback> run_log;
    std::uint32_t timeout_ms = 120000;
};

nlohmann::json planning_context_to_json(const PlanningRequest& request);

// The external reasoning component. propose() returns raw text that may
// wrap a plan payload in prose; an error means no usable response at all.
class PlannerOracle {
public:
    virtual ~PlannerOracle() = default;
    virtual core::errors::Result<std::string> propose(const PlanningRequest& request) = 0;
};

// Replays canned responses in order. Running past the end is a Parse
// error with code "oracle_exhausted".
class ScriptedOracle : public PlannerOracle {
public:
    explicit ScriptedOracle(std::vector<std::string> responses);

    // Reads a JSON array of strings.
    static core::errors::Result<std::shared_ptr<ScriptedOracle>> from_file(
        const std::filesystem::path& path);

    core::errors::Result<std::string> propose(const PlanningRequest& request) override;

    const std::vector<PlanningRequest>& requests() const { return requests_; }

private:
    std::vector<std::string> responses_;
    std::vector<PlanningRequest> requests_;
    std::size_t next_ = 0;
};

// Runs a shell command per attempt. The planning context is written as
// JSON to a file whose path is exported as PLANLOOP_CONTEXT_FILE; the
// command's stdout is the response.
class CommandOracle : public PlannerOracle {
public:
    CommandOracle(std::string command, std::filesystem::path working_directory,
                  std::filesystem::path scratch_directory);

    core::errors::Result<std::string> propose(const PlanningRequest& request) override;

private:
    std::string command_;
    std::filesystem::path working_directory_;
    std::filesystem::path scratch_directory_;
};

}  // namespace planloop::planning
