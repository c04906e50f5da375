// modules/substrate/activity_context.cpp
#include "modules/substrate/activity_context.h"
#include "common/errors.h"
#include <algorithm>

namespace durableflow {

ActivityContext::ActivityContext(std::string execution_id,
                                 std::string activity_name,
                                 int attempt,
                                 const ActivityOptions& options,
                                 nlohmann::json previous_heartbeat_details)
    : execution_id_(std::move(execution_id)),
      activity_name_(std::move(activity_name)),
      attempt_(attempt),
      started_at_(Clock::now()),
      start_to_close_timeout_(options.start_to_close_timeout),
      heartbeat_timeout_(options.heartbeat_timeout),
      last_heartbeat_(started_at_),
      heartbeat_details_(std::move(previous_heartbeat_details)) {}

void ActivityContext::heartbeat(nlohmann::json details) {
    if (cancelled()) {
        throw ActivityTimeoutError("Activity '" + activity_name_ + "' was abandoned by its host");
    }
    if (heartbeat_overdue()) {
        throw ActivityTimeoutError("Activity '" + activity_name_ + "' missed its heartbeat timeout");
    }
    if (deadline_exceeded()) {
        throw ActivityTimeoutError("Activity '" + activity_name_ + "' exceeded its start-to-close timeout");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    last_heartbeat_ = Clock::now();
    if (!details.is_null()) {
        heartbeat_details_ = std::move(details);
    }
}

nlohmann::json ActivityContext::heartbeat_details() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeat_details_;
}

bool ActivityContext::deadline_exceeded() const {
    return Clock::now() - started_at_ > start_to_close_timeout_;
}

bool ActivityContext::heartbeat_overdue() const {
    if (!heartbeat_timeout_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return Clock::now() - last_heartbeat_ > *heartbeat_timeout_;
}

std::chrono::milliseconds ActivityContext::time_remaining() const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    const auto now = Clock::now();
    auto remaining = duration_cast<milliseconds>(started_at_ + start_to_close_timeout_ - now);
    if (heartbeat_timeout_) {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining = std::min(remaining, duration_cast<milliseconds>(last_heartbeat_ + *heartbeat_timeout_ - now));
    }
    return std::max(remaining, milliseconds{0});
}

} // namespace durableflow
