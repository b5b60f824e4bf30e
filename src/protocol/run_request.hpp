#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace planloop::protocol {

    // Validated CLI input for one goal-pursuit run.
    struct RunRequest {
        std::string goal;
        std::optional<std::filesystem::path> responses_file;
        std::optional<std::string> planner_command;
        std::optional<std::string> replanner_command;
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::optional<std::uint32_t> max_attempts;
        bool verbose = false;
    };

} // namespace planloop::protocol
