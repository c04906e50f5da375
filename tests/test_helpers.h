// tests/test_helpers.h
#ifndef DURABLEFLOW_TESTS_TEST_HELPERS_H
#define DURABLEFLOW_TESTS_TEST_HELPERS_H

#include "common/errors.h"
#include "modules/substrate/execution_host.h"
#include "modules/trace/event_sink.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace durableflow::testing {

// Retry policy with millisecond backoff so that retry tests stay fast
inline ActivityOptions quick_options(int maximum_attempts = 3) {
    ActivityOptions options;
    options.start_to_close_timeout = std::chrono::seconds(5);
    options.retry.maximum_attempts = maximum_attempts;
    options.retry.backoff_coefficient = 2.0;
    options.retry.initial_interval = std::chrono::milliseconds(1);
    options.retry.maximum_interval = std::chrono::milliseconds(5);
    return options;
}

// Polls a query until the execution has registered its handler
template <typename Host>
nlohmann::json wait_for_query(Host& host, const std::string& execution_id, const std::string& query_name,
                              std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        try {
            return host.query(execution_id, query_name);
        } catch (const ExecutionStateError&) {
            if (std::chrono::steady_clock::now() >= deadline) throw;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

// Polls until predicate() holds; returns false on timeout
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// Rejects every event with TelemetryError, like an unreachable telemetry backend
class ThrowingEventSink : public EventSink {
public:
    void emit(const std::string& event_type, const nlohmann::json&) override {
        ++rejected_;
        throw TelemetryError("telemetry backend offline: " + event_type);
    }

    int rejected() const { return rejected_.load(); }

private:
    std::atomic<int> rejected_{0};
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace durableflow::testing

#endif // DURABLEFLOW_TESTS_TEST_HELPERS_H
