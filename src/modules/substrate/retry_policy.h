// modules/substrate/retry_policy.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_RETRY_POLICY_H
#define DURABLEFLOW_MODULES_SUBSTRATE_RETRY_POLICY_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace durableflow {

struct RetryPolicy {
    int maximum_attempts = 3; // 0 表示无限重试
    double backoff_coefficient = 2.0;
    std::chrono::milliseconds initial_interval{1000};
    std::chrono::milliseconds maximum_interval{30000};
    std::vector<std::string> non_retryable_errors; // DurableFlowError::kind() values

    // Delay before attempt `next_attempt` (2 = first retry)
    std::chrono::milliseconds delay_before_attempt(int next_attempt) const;
    bool has_attempts_left(int attempts_made) const;
    bool is_non_retryable(const std::string& error_kind) const;
};

struct ActivityOptions {
    std::chrono::milliseconds start_to_close_timeout{std::chrono::minutes(10)};
    std::optional<std::chrono::milliseconds> heartbeat_timeout;
    RetryPolicy retry;

    // Node bodies, LLM and tool calls: 10 minutes, 3 attempts, factor 2
    static ActivityOptions standard();
    // Event emission: 5 seconds, a single attempt
    static ActivityOptions fire_and_forget();
};

void to_json(nlohmann::json& j, const RetryPolicy& policy);
void from_json(const nlohmann::json& j, RetryPolicy& policy);
void to_json(nlohmann::json& j, const ActivityOptions& options);
void from_json(const nlohmann::json& j, ActivityOptions& options);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_RETRY_POLICY_H
