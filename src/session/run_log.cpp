#include "session/run_log.hpp"

#include <utility>

namespace planloop::session {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;

core::errors::Status RunLog::append(protocol::Feedback feedback) {
    if (!entries_.empty() &&
        feedback.plan_attempt_index <= entries_.back().plan_attempt_index) {
        return LifecycleError{ErrorCategory::Internal,
                              "Feedback for attempt " +
                                  std::to_string(feedback.plan_attempt_index) +
                                  " arrived after attempt " +
                                  std::to_string(entries_.back().plan_attempt_index),
                              "out_of_order_feedback"};
    }
    entries_.push_back(std::move(feedback));
    return core::errors::ok();
}

const protocol::Feedback* RunLog::find_attempt(const std::uint32_t attempt_index) const {
    for (const auto& entry : entries_) {
        if (entry.plan_attempt_index == attempt_index) {
            return &entry;
        }
    }
    return nullptr;
}

const protocol::Feedback* RunLog::latest() const {
    return entries_.empty() ? nullptr : &entries_.back();
}

}  // namespace planloop::session
