// modules/signal/signal_wait.cpp
#include "modules/signal/signal_wait.h"
#include "common/errors.h"
#include "common/logging/logger.h"

namespace durableflow {

SignalWait::SignalWait(ExecutionSession& session, std::string signal_name, std::string query_name)
    : session_(session),
      signal_name_(std::move(signal_name)),
      query_name_(std::move(query_name)) {
    if (!query_name_.empty()) {
        session_.set_query_handler(query_name_, [this]() { return nlohmann::json(has_received()); });
    }
    // 注册 handler 时会立即投递已缓冲的信号
    session_.set_signal_handler(signal_name_, [this](const nlohmann::json& payload) { signal(payload); });
}

SignalWait::~SignalWait() {
    session_.remove_signal_handler(signal_name_);
    if (!query_name_.empty()) {
        session_.remove_query_handler(query_name_);
    }
}

void SignalWait::signal(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::RECEIVED;
    value_ = payload;
}

bool SignalWait::has_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::RECEIVED;
}

SignalWait::State SignalWait::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

nlohmann::json SignalWait::wait(std::chrono::milliseconds timeout) {
    const bool received = session_.await_condition([this] { return has_received(); }, timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    if (received) {
        return nlohmann::json{{"received", true}, {"value", value_}};
    }
    state_ = State::TIMED_OUT;
    if (!session_.is_replaying()) {
        DF_LOG_INFO("[Signal] Wait for '{}' on {} timed out", signal_name_, session_.execution_id());
    }
    return nlohmann::json{{"received", false}, {"timedOut", true}};
}

nlohmann::json SignalWait::consume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::RECEIVED) {
        throw ExecutionStateError("No '" + signal_name_ + "' signal to consume");
    }
    nlohmann::json value = std::move(value_);
    value_ = nullptr;
    state_ = State::WAITING;
    return value;
}

std::string to_string(SignalWait::State state) {
    switch (state) {
        case SignalWait::State::WAITING:   return "waiting";
        case SignalWait::State::RECEIVED:  return "received";
        case SignalWait::State::TIMED_OUT: return "timed_out";
    }
    return "waiting";
}

} // namespace durableflow
