#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"

namespace planloop::tools {

struct ProcessRequest {
    // argv[0] is resolved through PATH.
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 30000;
};

struct ProcessCapture {
    int exit_code = -1;
    std::optional<int> term_signal;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs a child process to completion, capturing both output streams. The
// whole process group is killed when timeout_ms elapses before the child
// exits; timed_out is only set in that case. Once the child has exited,
// anything it left running in its process group gets a short grace period
// to finish writing output and is then killed. A child that
// cannot chdir or exec is reported as an error with code
// "process_start_failed", never as an exit status.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

ProcessRequest shell_request(const std::string& command,
                             const std::filesystem::path& working_directory,
                             std::uint32_t timeout_ms);

// Wraps value in single quotes for /bin/sh.
std::string shell_quote(const std::string& value);

}  // namespace planloop::tools
