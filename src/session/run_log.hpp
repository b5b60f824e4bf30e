#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "core/errors/lifecycle_errors.hpp"
#include "protocol/feedback.hpp"

namespace planloop::session {

// Ordered Feedback history of one run. Entries are only ever appended,
// each with a larger attempt index than the one before.
class RunLog {
public:
    // Fails with "out_of_order_feedback" when the attempt index does not
    // increase.
    core::errors::Status append(protocol::Feedback feedback);

    const std::vector<protocol::Feedback>& entries() const { return entries_; }

    // nullptr when no entry was recorded for that attempt.
    const protocol::Feedback* find_attempt(std::uint32_t attempt_index) const;

    const protocol::Feedback* latest() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<protocol::Feedback> entries_;
};

}  // namespace planloop::session
