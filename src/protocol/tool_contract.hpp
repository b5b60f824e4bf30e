#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>

namespace planloop::protocol {

    // Input key -> value, iterated in key order so diagnostics and logs
    // are reproducible.
    using ToolInputs = std::map<std::string, std::string>;

    // What the registry knows about a capability. The planner sees these.
    struct ToolSpec {
        std::string name;
        std::set<std::string> required_inputs;
        std::optional<std::string> output_schema;
        std::string description;
        bool read_only = false;
    };

    // What a tool reports after it ran. A tool that could not be started
    // reports an error instead of an outcome.
    struct ToolOutcome {
        int exit_status = 0;
        std::optional<int> term_signal;  // set when the process was killed
        std::string stdout_text;
        std::string stderr_text;
    };

} // namespace planloop::protocol
