#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/lifecycle_errors.hpp"
#include "core/logging/logger.hpp"

namespace planloop::core::config {

struct LifecycleConfig {
    std::uint32_t max_attempts = 3;
    std::uint32_t max_consecutive_parse_failures = 2;
    std::uint32_t planner_timeout_ms = 120000;
    std::uint32_t step_timeout_ms = 30000;
    // Executor deadline for one attempt, all steps together.
    std::uint32_t attempt_timeout_ms = 300000;
    std::string artifact_subdir = ".planloop_runs";
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

constexpr std::uint32_t kMaxAttemptsUpperBound = 100;

// Reads a JSON object of LifecycleConfig fields. Missing keys keep their
// defaults; unknown keys are rejected.
errors::Result<LifecycleConfig> load_config(const std::filesystem::path& path);

errors::Result<LifecycleConfig> config_from_json_text(const std::string& text);

// "run-" followed by 8 hex characters.
std::string generate_run_id();

}  // namespace planloop::core::config
