// modules/substrate/retry_policy.cpp
#include "modules/substrate/retry_policy.h"
#include "common/errors.h"
#include <algorithm>
#include <cmath>

namespace durableflow {

std::chrono::milliseconds RetryPolicy::delay_before_attempt(int next_attempt) const {
    if (next_attempt <= 1) return std::chrono::milliseconds{0};
    const double factor = std::pow(backoff_coefficient, next_attempt - 2);
    const double raw = static_cast<double>(initial_interval.count()) * factor;
    const double capped = std::min(raw, static_cast<double>(maximum_interval.count()));
    return std::chrono::milliseconds{static_cast<int64_t>(capped)};
}

bool RetryPolicy::has_attempts_left(int attempts_made) const {
    return maximum_attempts <= 0 || attempts_made < maximum_attempts;
}

bool RetryPolicy::is_non_retryable(const std::string& error_kind) const {
    return std::find(non_retryable_errors.begin(), non_retryable_errors.end(), error_kind)
        != non_retryable_errors.end();
}

ActivityOptions ActivityOptions::standard() {
    ActivityOptions options;
    options.start_to_close_timeout = std::chrono::minutes(10);
    options.retry.maximum_attempts = 3;
    options.retry.backoff_coefficient = 2.0;
    return options;
}

ActivityOptions ActivityOptions::fire_and_forget() {
    ActivityOptions options;
    options.start_to_close_timeout = std::chrono::seconds(5);
    options.retry.maximum_attempts = 1;
    return options;
}

void to_json(nlohmann::json& j, const RetryPolicy& policy) {
    j = nlohmann::json{
        {"maximum_attempts", policy.maximum_attempts},
        {"backoff_coefficient", policy.backoff_coefficient},
        {"initial_interval_ms", policy.initial_interval.count()},
        {"maximum_interval_ms", policy.maximum_interval.count()},
        {"non_retryable_errors", policy.non_retryable_errors}
    };
}

void from_json(const nlohmann::json& j, RetryPolicy& policy) {
    policy.maximum_attempts = j.value("maximum_attempts", policy.maximum_attempts);
    policy.backoff_coefficient = j.value("backoff_coefficient", policy.backoff_coefficient);
    policy.initial_interval = std::chrono::milliseconds{
        j.value("initial_interval_ms", static_cast<int64_t>(policy.initial_interval.count()))};
    policy.maximum_interval = std::chrono::milliseconds{
        j.value("maximum_interval_ms", static_cast<int64_t>(policy.maximum_interval.count()))};
    policy.non_retryable_errors = j.value("non_retryable_errors", policy.non_retryable_errors);

    if (policy.maximum_attempts < 0) {
        throw ConfigError("retry.maximum_attempts must be >= 0");
    }
    if (policy.backoff_coefficient < 1.0) {
        throw ConfigError("retry.backoff_coefficient must be >= 1.0");
    }
    if (policy.initial_interval.count() < 0 || policy.maximum_interval < policy.initial_interval) {
        throw ConfigError("retry intervals must satisfy 0 <= initial_interval <= maximum_interval");
    }
}

void to_json(nlohmann::json& j, const ActivityOptions& options) {
    j = nlohmann::json{
        {"timeout_ms", options.start_to_close_timeout.count()},
        {"retry", options.retry}
    };
    if (options.heartbeat_timeout) j["heartbeat_timeout_ms"] = options.heartbeat_timeout->count();
}

void from_json(const nlohmann::json& j, ActivityOptions& options) {
    options.start_to_close_timeout = std::chrono::milliseconds{
        j.value("timeout_ms", static_cast<int64_t>(options.start_to_close_timeout.count()))};
    if (options.start_to_close_timeout.count() <= 0) {
        throw ConfigError("activity timeout_ms must be positive");
    }
    if (j.contains("heartbeat_timeout_ms")) {
        options.heartbeat_timeout = std::chrono::milliseconds{j.at("heartbeat_timeout_ms").get<int64_t>()};
    }
    if (j.contains("retry")) {
        RetryPolicy policy = options.retry;
        from_json(j.at("retry"), policy);
        options.retry = std::move(policy);
    }
}

} // namespace durableflow
