// modules/substrate/activity_context.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_ACTIVITY_CONTEXT_H
#define DURABLEFLOW_MODULES_SUBSTRATE_ACTIVITY_CONTEXT_H

#include "modules/substrate/retry_policy.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace durableflow {

// Passed to every activity attempt. The attempt runs on a worker thread; the
// host watches its start-to-close deadline and heartbeat window and abandons
// it when either runs out. heartbeat() throws ActivityTimeoutError once the
// attempt has been abandoned, so cooperative activities stop early.
class ActivityContext {
public:
    ActivityContext(std::string execution_id,
                    std::string activity_name,
                    int attempt,
                    const ActivityOptions& options,
                    nlohmann::json previous_heartbeat_details);

    const std::string& execution_id() const { return execution_id_; }
    const std::string& activity_name() const { return activity_name_; }
    int attempt() const { return attempt_; }

    void heartbeat(nlohmann::json details = nullptr);

    // Details from the last heartbeat of this or the previous attempt
    nlohmann::json heartbeat_details() const;

    bool deadline_exceeded() const;
    bool heartbeat_overdue() const;

    // Time until the deadline or the heartbeat window closes, whichever is first
    std::chrono::milliseconds time_remaining() const;

    // 宿主放弃本次尝试（超时或宿主停止）
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    std::string execution_id_;
    std::string activity_name_;
    int attempt_;
    Clock::time_point started_at_;
    std::chrono::milliseconds start_to_close_timeout_;
    std::optional<std::chrono::milliseconds> heartbeat_timeout_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    Clock::time_point last_heartbeat_;
    nlohmann::json heartbeat_details_;
};

using ActivityFunction = std::function<nlohmann::json(ActivityContext&, const nlohmann::json&)>;

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_ACTIVITY_CONTEXT_H
