#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/lifecycle_config.hpp"
#include "core/errors/lifecycle_errors.hpp"
#include "core/logging/logger.hpp"
#include "planning/planner_oracle.hpp"
#include "protocol/plan.hpp"
#include "runtime/lifecycle_orchestrator.hpp"
#include "session/artifact_writer.hpp"
#include "session/run_manager.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

void log_error(const std::string& context, const planloop::core::errors::LifecycleError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = planloop::core::errors;
    using planloop::core::logging::Logger;

    std::string bootstrap_run_id = planloop::core::config::generate_run_id();
    Logger::get().set_run_id(bootstrap_run_id);

    LOG_DEBUG("planloop: bootstrapping");
    auto parsed = planloop::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        log_error("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& req = errors::get_value(parsed);

    // File values first, then CLI overrides.
    planloop::core::config::LifecycleConfig config;
    if (req.config_file.has_value()) {
        auto loaded = planloop::core::config::load_config(req.config_file.value());
        if (errors::is_error(loaded)) {
            log_error("Config error", errors::get_error(loaded));
            return 2;
        }
        config = errors::get_value(loaded);
    }
    if (req.max_attempts.has_value()) {
        config.max_attempts = req.max_attempts.value();
    }
    Logger::get().set_min_level(req.verbose ? planloop::core::logging::LogLevel::DEBUG
                                            : config.log_level);

    planloop::tools::ToolRegistry registry;
    auto registered = planloop::tools::register_builtin_tools(registry);
    if (errors::is_error(registered)) {
        log_error("Failed to register tools", errors::get_error(registered));
        return 3;
    }

    const auto scratch_dir = req.working_directory / config.artifact_subdir / "context";
    std::shared_ptr<planloop::planning::PlannerOracle> planner;
    std::shared_ptr<planloop::planning::PlannerOracle> replanner;
    if (req.responses_file.has_value()) {
        auto scripted = planloop::planning::ScriptedOracle::from_file(req.responses_file.value());
        if (errors::is_error(scripted)) {
            log_error("Input error", errors::get_error(scripted));
            return 2;
        }
        planner = errors::get_value(scripted);
    } else {
        planner = std::make_shared<planloop::planning::CommandOracle>(
            req.planner_command.value(), req.working_directory, scratch_dir);
    }
    if (req.replanner_command.has_value()) {
        replanner = std::make_shared<planloop::planning::CommandOracle>(
            req.replanner_command.value(), req.working_directory, scratch_dir);
    }

    planloop::session::ArtifactWriter artifact_writer(req.working_directory,
                                                      config.artifact_subdir);
    std::atomic<bool> artifact_failed{false};

    planloop::session::RunManager run_manager;
    auto started = run_manager.start_run([&](const std::string& run_id) {
        Logger::get().set_run_id(run_id);

        auto request_artifact = artifact_writer.write_request(run_id, req);
        if (errors::is_error(request_artifact)) {
            const auto& err = errors::get_error(request_artifact);
            log_error("Failed to write request artifact", err);
            artifact_failed = true;
            planloop::runtime::RunOutcome aborted;
            aborted.failure = err;
            return aborted;
        }

        planloop::runtime::LifecycleOrchestrator orchestrator(
            registry, *planner, replanner.get(), config, req.working_directory);
        orchestrator.set_feedback_listener(
            [&artifact_writer, &artifact_failed, run_id](const planloop::protocol::Feedback& feedback) {
                auto written = artifact_writer.write_feedback(run_id, feedback);
                if (errors::is_error(written)) {
                    log_error("Failed to write feedback artifact", errors::get_error(written));
                    artifact_failed = true;
                }
            });
        return orchestrator.run(planloop::protocol::Goal{req.goal});
    });
    if (errors::is_error(started)) {
        log_error("Failed to start run", errors::get_error(started));
        return 3;
    }

    const std::string run_id = errors::get_value(started);
    auto waited = run_manager.wait(run_id);
    if (errors::is_error(waited)) {
        log_error("Failed to collect run outcome", errors::get_error(waited));
        return 3;
    }
    const auto& outcome = errors::get_value(waited);
    if (artifact_failed) {
        return 6;
    }

    const auto* latest = outcome.run_log.latest();
    if (latest != nullptr) {
        LOG_INFO("Run summary:\n" + latest->narrative_summary);
    }
    LOG_INFO("Final run state: " + planloop::runtime::to_string(outcome.status) + " after " +
             std::to_string(outcome.attempts) + " attempt(s)");
    if (outcome.failure.has_value()) {
        log_error("Run failed", outcome.failure.value());
    }

    auto final_artifact = artifact_writer.write_final(run_id, outcome);
    if (errors::is_error(final_artifact)) {
        log_error("Failed to write final artifact", errors::get_error(final_artifact));
        return 6;
    }
    LOG_INFO("Artifacts: " + errors::get_value(final_artifact).string());

    return outcome.status == planloop::runtime::RunStatus::Succeeded ? 0 : 1;
}
