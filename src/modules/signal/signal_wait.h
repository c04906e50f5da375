// modules/signal/signal_wait.h
#ifndef DURABLEFLOW_MODULES_SIGNAL_SIGNAL_WAIT_H
#define DURABLEFLOW_MODULES_SIGNAL_SIGNAL_WAIT_H

#include "modules/substrate/execution_session.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <string>

namespace durableflow {

// Suspend-until-signal-or-timeout building block.
//   WAITING --signal--> RECEIVED --consume--> WAITING
//   WAITING --timeout--> TIMED_OUT
// The state is rebuilt on replay because every delivery goes through the
// session's recorded signal handler.
class SignalWait {
public:
    enum class State { WAITING, RECEIVED, TIMED_OUT };

    // Registers the signal handler, and the `has received` query when
    // query_name is non-empty. The query is removed on destruction.
    SignalWait(ExecutionSession& session, std::string signal_name, std::string query_name = "");
    ~SignalWait();

    SignalWait(const SignalWait&) = delete;
    SignalWait& operator=(const SignalWait&) = delete;

    // Later deliveries before consume() overwrite the value
    void signal(const nlohmann::json& payload);

    // Non-blocking; safe from any thread
    bool has_received() const;

    // {"received": true, "value": ...} or {"received": false, "timedOut": true}
    nlohmann::json wait(std::chrono::milliseconds timeout);

    // Returns the received value and re-arms. Throws ExecutionStateError if nothing was received.
    nlohmann::json consume();

    State state() const;
    const std::string& signal_name() const { return signal_name_; }

private:
    ExecutionSession& session_;
    std::string signal_name_;
    std::string query_name_;

    mutable std::mutex mutex_;
    State state_ = State::WAITING;
    nlohmann::json value_;
};

std::string to_string(SignalWait::State state);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SIGNAL_SIGNAL_WAIT_H
