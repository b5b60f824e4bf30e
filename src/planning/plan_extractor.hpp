#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/lifecycle_errors.hpp"

namespace planloop::planning {

// Pulls the first {"plan": [...]} object out of free-form planner output.
// Reasoning-trace blocks (<think>...</think> and friends) are removed
// first; prose and markdown fences around the object are skipped by the
// scan. Never throws: a response without a plan-shaped object is a
// Parse error ("empty_response" or "no_plan_payload").
core::errors::Result<nlohmann::json> extract_plan_payload(const std::string& raw_text);

// raw_text without reasoning-trace blocks. An unterminated block swallows
// the rest of the text.
std::string strip_reasoning_blocks(const std::string& raw_text);

}  // namespace planloop::planning
