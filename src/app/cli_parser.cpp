#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "core/config/lifecycle_config.hpp"

namespace planloop::app::cli {

    using namespace planloop::core::errors;
    using planloop::protocol::RunRequest;

    // Raw flag values before validation.
    struct RawCliOptions {
        std::optional<std::string> goal;
        std::optional<std::string> responses;
        std::optional<std::string> planner_cmd;
        std::optional<std::string> replanner_cmd;
        std::optional<std::string> config;
        std::optional<std::string> cwd;
        std::optional<std::string> max_attempts;
        bool verbose = false;
    };

    namespace {

        const char* kUsage =
            "Usage: planloop run --goal \"...\" (--responses FILE | --planner-cmd CMD) "
            "[--replanner-cmd CMD] [--config FILE] [--cwd DIR] [--max-attempts N] [--verbose]";

        Result<std::filesystem::path> existing_path(const std::string& text, bool want_directory,
                                                    const std::string& what) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return LifecycleError{ErrorCategory::Input, what + " does not exist: " + text, "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || is_dir != want_directory) {
                return LifecycleError{ErrorCategory::Input,
                                      what + (want_directory ? " is not a directory: " : " is not a file: ") + text,
                                      "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return LifecycleError{ErrorCategory::Input, "Failed to canonicalize " + what + ": " + text, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LifecycleError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return LifecycleError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and 'run'
            args.push_back(argv[i]);
        }

        const std::vector<std::pair<std::string, std::optional<std::string> RawCliOptions::*>> valued_flags = {
            {"--goal", &RawCliOptions::goal},
            {"--responses", &RawCliOptions::responses},
            {"--planner-cmd", &RawCliOptions::planner_cmd},
            {"--replanner-cmd", &RawCliOptions::replanner_cmd},
            {"--config", &RawCliOptions::config},
            {"--cwd", &RawCliOptions::cwd},
            {"--max-attempts", &RawCliOptions::max_attempts},
        };

        // Parser phase: just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, member] : valued_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return LifecycleError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                raw.*member = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return LifecycleError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // Validator phase: enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;

        if (!raw.goal.has_value() || raw.goal->empty()) {
            return LifecycleError{ErrorCategory::Input, "Must provide a non-empty --goal", "missing_required_flag", kUsage};
        }
        req.goal = raw.goal.value();

        if (!raw.responses.has_value() && !raw.planner_cmd.has_value()) {
            return LifecycleError{ErrorCategory::Input, "Must provide either --responses or --planner-cmd", "missing_required_flag"};
        }
        if (raw.responses.has_value() && raw.planner_cmd.has_value()) {
            return LifecycleError{ErrorCategory::Input, "Cannot provide both --responses and --planner-cmd", "conflicting_flags"};
        }
        if (raw.responses.has_value() && raw.replanner_cmd.has_value()) {
            return LifecycleError{ErrorCategory::Input, "--replanner-cmd requires --planner-cmd", "conflicting_flags"};
        }

        if (raw.planner_cmd) {
            if (raw.planner_cmd->empty()) {
                return LifecycleError{ErrorCategory::Input, "--planner-cmd cannot be empty", "missing_value"};
            }
            req.planner_command = raw.planner_cmd.value();
        }
        if (raw.replanner_cmd) {
            if (raw.replanner_cmd->empty()) {
                return LifecycleError{ErrorCategory::Input, "--replanner-cmd cannot be empty", "missing_value"};
            }
            req.replanner_command = raw.replanner_cmd.value();
        }

        // Exception-free integer parsing
        if (raw.max_attempts) {
            uint32_t attempts = 0;
            const char* begin = raw.max_attempts->data();
            const char* end = raw.max_attempts->data() + raw.max_attempts->size();
            auto [ptr, ec] = std::from_chars(begin, end, attempts);
            if (ec != std::errc() || ptr != end) {
                return LifecycleError{ErrorCategory::Input, "Invalid number for --max-attempts", "invalid_integer", "Provide a positive integer."};
            }
            if (attempts == 0 || attempts > planloop::core::config::kMaxAttemptsUpperBound) {
                return LifecycleError{ErrorCategory::Input, "--max-attempts out of bounds", "bounds_error",
                                      "Must be between 1 and " + std::to_string(planloop::core::config::kMaxAttemptsUpperBound) + "."};
            }
            req.max_attempts = attempts;
        }

        // Path validation
        if (raw.cwd) {
            auto cwd = existing_path(raw.cwd.value(), true, "Working directory");
            if (is_error(cwd)) {
                return get_error(cwd);
            }
            req.working_directory = get_value(cwd);
        }
        if (raw.responses) {
            auto responses = existing_path(raw.responses.value(), false, "Responses file");
            if (is_error(responses)) {
                return get_error(responses);
            }
            req.responses_file = get_value(responses);
        }
        if (raw.config) {
            auto config = existing_path(raw.config.value(), false, "Config file");
            if (is_error(config)) {
                return get_error(config);
            }
            req.config_file = get_value(config);
        }

        return req;
    }

} // namespace planloop::app::cli
