// modules/substrate/local_execution_session.cpp
#include "modules/substrate/local_execution_session.h"
#include "common/errors.h"
#include <algorithm>

namespace durableflow {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

} // namespace

LocalExecutionSession::LocalExecutionSession(ExecutionHost& host, ExecutionSlot& slot, const ExecutionHistory& history)
    : host_(host),
      slot_(slot),
      execution_id_(history.execution_id),
      run_number_(history.run_number),
      events_(history.events) {}

LocalExecutionSession::~LocalExecutionSession() = default;

const HistoryEvent* LocalExecutionSession::replay_next(std::initializer_list<HistoryEventType> types,
                                                       const std::string& name) {
    if (!is_replaying()) return nullptr;
    const HistoryEvent& event = events_[cursor_];
    const bool type_matches = std::find(types.begin(), types.end(), event.type) != types.end();
    if (!type_matches || event.name != name) {
        throw NonDeterminismError("Execution '" + execution_id_ + "' diverged from its history at event " +
                                  std::to_string(cursor_) + ": recorded " + to_string(event.type) + "(" +
                                  event.name + "), issued " + to_string(*types.begin()) + "(" + name + ")");
    }
    ++cursor_;
    return &event;
}

void LocalExecutionSession::record(HistoryEventType type, const std::string& name, nlohmann::json payload) {
    HistoryEvent event{type, name, std::move(payload)};
    host_.store().append_event(execution_id_, event);
    events_.push_back(std::move(event));
    cursor_ = events_.size();
}

void LocalExecutionSession::sync_signals() {
    // 重放阶段：按历史顺序把已记录的信号交给 handler
    while (is_replaying() && events_[cursor_].type == HistoryEventType::SIGNAL_RECEIVED) {
        const HistoryEvent& event = events_[cursor_];
        auto it = signal_handlers_.find(event.name);
        if (it == signal_handlers_.end()) {
            return; // handler registered later in the run
        }
        SignalHandler handler = it->second;
        nlohmann::json payload = event.payload.contains("payload") ? event.payload.at("payload") : nlohmann::json(nullptr);
        last_signal_id_ = std::max(last_signal_id_, event.payload.value("id", int64_t{0}));
        ++cursor_;
        handler(payload);
    }
    if (!is_replaying()) {
        drain_inbox();
    }
}

void LocalExecutionSession::drain_inbox() {
    int64_t acked = 0;
    for (const auto& signal : host_.store().pending_signals(execution_id_)) {
        if (signal.id <= last_signal_id_) {
            acked = signal.id;
            continue;
        }
        auto it = signal_handlers_.find(signal.name);
        if (it == signal_handlers_.end()) {
            break; // stays buffered; later signals wait behind it
        }
        SignalHandler handler = it->second;
        record(HistoryEventType::SIGNAL_RECEIVED, signal.name,
               nlohmann::json{{"id", signal.id}, {"payload", signal.payload}});
        last_signal_id_ = signal.id;
        acked = signal.id;
        handler(signal.payload);
    }
    if (acked > 0) {
        host_.store().ack_signals(execution_id_, acked);
    }
}

nlohmann::json LocalExecutionSession::execute_activity(const std::string& activity_name,
                                                       const ActivityOptions& options,
                                                       const nlohmann::json& input) {
    sync_signals();

    HistoryEvent outcome;
    if (const HistoryEvent* recorded = replay_next({HistoryEventType::ACTIVITY_COMPLETED,
                                                    HistoryEventType::ACTIVITY_FAILED}, activity_name)) {
        outcome = *recorded;
    } else {
        if (host_.stopping()) {
            throw ExecutionEvicted{};
        }
        try {
            nlohmann::json result = host_.run_activity(slot_, activity_name, options, input);
            record(HistoryEventType::ACTIVITY_COMPLETED, activity_name, nlohmann::json{{"result", std::move(result)}});
        } catch (const ActivityFailure& failure) {
            record(HistoryEventType::ACTIVITY_FAILED, activity_name,
                   nlohmann::json{{"cause_kind", failure.cause_kind()},
                                  {"message", failure.what()},
                                  {"attempts", failure.attempts()}});
        }
        outcome = events_.back();
    }

    sync_signals();

    if (outcome.type == HistoryEventType::ACTIVITY_FAILED) {
        throw ActivityFailure(activity_name,
                              outcome.payload.value("cause_kind", std::string("Error")),
                              outcome.payload.value("message", std::string()),
                              outcome.payload.value("attempts", 1));
    }
    return outcome.payload.contains("result") ? outcome.payload.at("result") : nlohmann::json(nullptr);
}

bool LocalExecutionSession::wait_durably(HistoryEventType start_type,
                                         HistoryEventType end_type,
                                         const std::string& name,
                                         const std::function<bool()>& predicate,
                                         std::chrono::milliseconds timeout) {
    using std::chrono::system_clock;

    sync_signals();

    // 截止时间以绝对时间记录，恢复后的 run 只等到原定时刻
    std::optional<system_clock::time_point> deadline;
    if (const HistoryEvent* started = replay_next({start_type}, name)) {
        const auto& recorded = started->payload;
        if (recorded.contains("deadline_ms") && !recorded.at("deadline_ms").is_null()) {
            deadline = from_epoch_ms(recorded.at("deadline_ms").get<int64_t>());
        }
    } else {
        if (timeout != kNoTimeout) {
            deadline = from_epoch_ms(to_epoch_ms(system_clock::now() + timeout));
        }
        record(start_type, name,
               nlohmann::json{{"deadline_ms", deadline ? nlohmann::json(to_epoch_ms(*deadline)) : nlohmann::json(nullptr)}});
    }

    for (;;) {
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(slot_.mutex);
            generation = slot_.signal_generation;
        }

        sync_signals();

        if (is_replaying()) {
            const HistoryEvent* resolved = replay_next({end_type}, name);
            return resolved->payload.value("satisfied", false);
        }

        if (predicate()) {
            record(end_type, name, nlohmann::json{{"satisfied", true}});
            return true;
        }
        const auto now = system_clock::now();
        if (deadline && now >= *deadline) {
            record(end_type, name, nlohmann::json{{"satisfied", false}});
            return false;
        }

        std::unique_lock<std::mutex> lock(slot_.mutex);
        auto woken = [&] { return host_.stopping() || slot_.signal_generation != generation; };
        if (deadline) {
            slot_.cv.wait_for(lock, *deadline - now, woken);
        } else {
            slot_.cv.wait(lock, woken);
        }
        if (host_.stopping()) {
            throw ExecutionEvicted{};
        }
    }
}

void LocalExecutionSession::sleep(std::chrono::milliseconds duration) {
    wait_durably(HistoryEventType::TIMER_STARTED, HistoryEventType::TIMER_FIRED, "sleep",
                 [] { return false; }, duration);
}

bool LocalExecutionSession::await_condition(const std::function<bool()>& predicate,
                                            std::chrono::milliseconds timeout) {
    return wait_durably(HistoryEventType::CONDITION_STARTED, HistoryEventType::CONDITION_RESOLVED, "condition",
                        predicate, timeout);
}

void LocalExecutionSession::set_signal_handler(const std::string& signal_name, SignalHandler handler) {
    signal_handlers_[signal_name] = std::move(handler);
    sync_signals();
}

void LocalExecutionSession::remove_signal_handler(const std::string& signal_name) {
    signal_handlers_.erase(signal_name);
}

void LocalExecutionSession::set_query_handler(const std::string& query_name, QueryHandler handler) {
    std::lock_guard<std::mutex> lock(slot_.query_mutex);
    slot_.query_handlers[query_name] = std::move(handler);
}

void LocalExecutionSession::remove_query_handler(const std::string& query_name) {
    std::lock_guard<std::mutex> lock(slot_.query_mutex);
    slot_.query_handlers.erase(query_name);
}

void LocalExecutionSession::continue_as_new(nlohmann::json input) {
    throw ContinueAsNew{std::move(input)};
}

std::chrono::system_clock::time_point LocalExecutionSession::now() {
    if (const HistoryEvent* recorded = replay_next({HistoryEventType::SIDE_EFFECT}, "now")) {
        return from_epoch_ms(recorded->payload.at("epoch_ms").get<int64_t>());
    }
    const int64_t epoch_ms = to_epoch_ms(std::chrono::system_clock::now());
    record(HistoryEventType::SIDE_EFFECT, "now", nlohmann::json{{"epoch_ms", epoch_ms}});
    return from_epoch_ms(epoch_ms);
}

} // namespace durableflow
