#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace planloop::validation {

struct PlaceholderMatch {
    std::string token;
    std::size_t position = 0;
};

// Heuristic scan for template tokens a planner forgot to fill in:
//   <file>, <branch name>        angle-bracket tokens
//   $output[run_command]         references to earlier step output
//   {{ path }}                   mustache variables
//   YOUR_API_KEY, REPLACE_ME_X   shouted fill-me-in markers
// Angle brackets that do not form such a token (comparisons, redirects,
// C++ includes, paired markup like <b>x</b>) are left alone.
// Returns the earliest match.
std::optional<PlaceholderMatch> find_placeholder(const std::string& value);

}  // namespace planloop::validation
