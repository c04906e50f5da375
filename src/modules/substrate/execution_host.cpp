// modules/substrate/execution_host.cpp
#include "modules/substrate/execution_host.h"
#include "modules/substrate/local_execution_session.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include <algorithm>

namespace durableflow {

namespace {

// 等待 activity 时检查宿主停止的最长间隔
constexpr std::chrono::milliseconds kWatchInterval{20};

} // namespace

ExecutionHost::ExecutionHost(std::shared_ptr<HistoryStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw ConfigError("ExecutionHost requires a history store");
    }
}

ExecutionHost::~ExecutionHost() {
    stop();
}

void ExecutionHost::register_workflow(const std::string& workflow_type, WorkflowFunction fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[workflow_type] = std::move(fn);
}

void ExecutionHost::register_activity(const std::string& activity_name, ActivityFunction fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    activities_[activity_name] = std::move(fn);
}

std::shared_ptr<ExecutionSlot> ExecutionHost::find_slot(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(execution_id);
    return it == slots_.end() ? nullptr : it->second;
}

void ExecutionHost::start(const std::string& execution_id,
                          const std::string& workflow_type,
                          const nlohmann::json& input) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workflows_.count(workflow_type) == 0) {
            throw ConfigError("Unknown workflow type: " + workflow_type);
        }
    }
    store_->create(execution_id, workflow_type, input);
    DF_LOG_INFO("[Host] Starting {} execution {}", workflow_type, execution_id);
    launch(execution_id);
}

void ExecutionHost::launch(const std::string& execution_id) {
    auto slot = std::make_shared<ExecutionSlot>();
    slot->execution_id = execution_id;

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        throw ExecutionStateError("Host is stopping; cannot run " + execution_id);
    }
    reap_finished_locked();
    slots_[execution_id] = slot;
    slot->thread = std::thread(&ExecutionHost::run_execution, this, slot);
}

void ExecutionHost::signal(const std::string& execution_id,
                           const std::string& signal_name,
                           const nlohmann::json& payload) {
    const int64_t signal_id = store_->enqueue_signal(execution_id, signal_name, payload);
    DF_LOG_DEBUG("[Host] Signal {} #{} queued for {}", signal_name, signal_id, execution_id);

    if (auto slot = find_slot(execution_id)) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            ++slot->signal_generation;
        }
        slot->cv.notify_all();
    }
}

nlohmann::json ExecutionHost::query(const std::string& execution_id, const std::string& query_name) {
    auto slot = find_slot(execution_id);
    if (!slot) {
        throw ExecutionStateError("Execution is not running on this host: " + execution_id);
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->done) {
            throw ExecutionStateError("Execution has finished: " + execution_id);
        }
    }
    std::lock_guard<std::mutex> lock(slot->query_mutex);
    auto it = slot->query_handlers.find(query_name);
    if (it == slot->query_handlers.end()) {
        throw ExecutionStateError("No query handler '" + query_name + "' on execution " + execution_id);
    }
    return it->second();
}

std::optional<nlohmann::json> ExecutionHost::wait_result(const std::string& execution_id,
                                                         std::chrono::milliseconds timeout) {
    auto slot = find_slot(execution_id);
    if (!slot) {
        auto history = store_->load(execution_id);
        if (!history) {
            throw ExecutionStateError("Unknown execution: " + execution_id);
        }
        if (history->closed) return history->outcome;
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(slot->mutex);
    auto finished = [&] { return slot->done; };
    if (timeout == kNoTimeout) {
        slot->cv.wait(lock, finished);
    } else if (!slot->cv.wait_for(lock, timeout, finished)) {
        return std::nullopt;
    }
    if (slot->evicted) return std::nullopt;
    return slot->outcome;
}

std::vector<std::string> ExecutionHost::resume_pending() {
    std::vector<std::string> resumed;
    for (const auto& execution_id : store_->list_open()) {
        if (find_slot(execution_id)) continue;
        DF_LOG_INFO("[Host] Resuming execution {}", execution_id);
        launch(execution_id);
        resumed.push_back(execution_id);
    }
    return resumed;
}

void ExecutionHost::stop() {
    stopping_ = true;

    std::vector<std::shared_ptr<ExecutionSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }
    for (auto& slot : slots) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
        }
        slot->cv.notify_all();
    }
    for (auto& slot : slots) {
        if (slot->thread.joinable() && slot->thread.get_id() != std::this_thread::get_id()) {
            slot->thread.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
}

size_t ExecutionHost::live_executions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

size_t ExecutionHost::retained_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = finished_threads_.size();
    for (const auto& [id, slot] : slots_) {
        if (slot->thread.joinable()) ++count;
    }
    return count;
}

void ExecutionHost::reap_finished_locked() {
    // retire() 之后线程只剩返回，join 不会阻塞在 mutex_ 上
    for (auto& thread : finished_threads_) {
        if (!thread.joinable()) continue;
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
    finished_threads_.clear();
}

void ExecutionHost::retire(const std::shared_ptr<ExecutionSlot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return; // stop() joins the thread
    }
    auto it = slots_.find(slot->execution_id);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
    finished_threads_.push_back(std::move(slot->thread));
}

void ExecutionHost::finish(ExecutionSlot& slot, const nlohmann::json& outcome) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.done = true;
        slot.outcome = outcome;
    }
    slot.cv.notify_all();
}

void ExecutionHost::run_execution(std::shared_ptr<ExecutionSlot> slot) {
    const std::string& execution_id = slot->execution_id;
    try {
        for (;;) {
            auto history = store_->load(execution_id);
            if (!history) {
                throw ExecutionStateError("Execution vanished from history store: " + execution_id);
            }

            WorkflowFunction workflow;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = workflows_.find(history->workflow_type);
                if (it != workflows_.end()) workflow = it->second;
            }
            if (!workflow) {
                throw ConfigError("Unknown workflow type: " + history->workflow_type);
            }

            LocalExecutionSession session(*this, *slot, *history);
            try {
                nlohmann::json result = workflow(session, history->input);
                nlohmann::json outcome{{"status", "completed"}, {"result", std::move(result)}};
                store_->close(execution_id, outcome);
                DF_LOG_INFO("[Host] Execution {} completed", execution_id);
                finish(*slot, outcome);
                break;
            } catch (const ContinueAsNew& restart) {
                {
                    std::lock_guard<std::mutex> lock(slot->query_mutex);
                    slot->query_handlers.clear();
                }
                if (session.last_signal_id() > 0) {
                    store_->ack_signals(execution_id, session.last_signal_id());
                }
                store_->start_new_run(execution_id, restart.input);
                DF_LOG_INFO("[Host] Execution {} continued as new (run {})", execution_id, history->run_number + 1);
            }
        }
    } catch (const ExecutionEvicted&) {
        DF_LOG_INFO("[Host] Execution {} evicted; it stays open in the history store", execution_id);
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->evicted = true;
        }
        finish(*slot, nullptr);
    } catch (const std::exception& e) {
        const auto* typed = dynamic_cast<const DurableFlowError*>(&e);
        nlohmann::json outcome{{"status", "failed"},
                               {"error", e.what()},
                               {"kind", typed ? typed->kind() : std::string("Error")}};
        DF_LOG_ERROR("[Host] Execution {} failed: {}", execution_id, e.what());
        try {
            store_->close(execution_id, outcome);
        } catch (const std::exception& close_error) {
            DF_LOG_ERROR("[Host] Could not close execution {}: {}", execution_id, close_error.what());
        }
        finish(*slot, outcome);
    }
    retire(slot);
}

nlohmann::json ExecutionHost::run_activity(ExecutionSlot& slot,
                                           const std::string& activity_name,
                                           const ActivityOptions& options,
                                           const nlohmann::json& input) {
    ActivityFunction fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = activities_.find(activity_name);
        if (it != activities_.end()) fn = it->second;
    }
    if (!fn) {
        throw ActivityFailure(activity_name, "ActivityNotRegistered",
                              "Activity '" + activity_name + "' is not registered", 1);
    }

    nlohmann::json heartbeat_details;
    for (int attempt = 1;; ++attempt) {
        auto context = std::make_shared<ActivityContext>(slot.execution_id, activity_name, attempt, options,
                                                         heartbeat_details);
        auto promise = std::make_shared<std::promise<nlohmann::json>>();
        std::future<nlohmann::json> future = promise->get_future();
        // 被放弃的尝试在自己的线程上跑完，结果直接丢弃
        std::thread([fn, input, context, promise] {
            try {
                promise->set_value(fn(*context, input));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        std::string kind = "Error";
        std::string message;
        bool retryable = true;
        try {
            return await_attempt(activity_name, future, *context);
        } catch (const DurableFlowError& e) {
            kind = e.kind();
            message = e.what();
            retryable = e.retryable();
        } catch (const std::exception& e) {
            message = e.what();
        }
        heartbeat_details = context->heartbeat_details();

        const bool can_retry = retryable &&
                               !options.retry.is_non_retryable(kind) &&
                               options.retry.has_attempts_left(attempt);
        if (!can_retry) {
            DF_LOG_WARN("[Host] Activity {} failed after {} attempt(s): {}", activity_name, attempt, message);
            throw ActivityFailure(activity_name, kind, message, attempt);
        }

        const auto delay = options.retry.delay_before_attempt(attempt + 1);
        DF_LOG_DEBUG("[Host] Activity {} attempt {} failed ({}), retrying in {}ms",
                     activity_name, attempt, message, delay.count());
        std::unique_lock<std::mutex> lock(slot.mutex);
        if (slot.cv.wait_for(lock, delay, [this] { return stopping_.load(); })) {
            throw ExecutionEvicted{};
        }
    }
}

nlohmann::json ExecutionHost::await_attempt(const std::string& activity_name,
                                            std::future<nlohmann::json>& attempt,
                                            ActivityContext& context) {
    const std::string deadline_message = "Activity '" + activity_name + "' exceeded its start-to-close timeout";
    const std::string heartbeat_message = "Activity '" + activity_name + "' missed its heartbeat timeout";

    for (;;) {
        const auto slice = std::clamp(context.time_remaining(), std::chrono::milliseconds{1}, kWatchInterval);
        if (attempt.wait_for(slice) == std::future_status::ready) {
            break;
        }
        if (stopping_) {
            context.cancel();
            throw ExecutionEvicted{};
        }
        if (context.heartbeat_overdue()) {
            context.cancel();
            throw ActivityTimeoutError(heartbeat_message);
        }
        if (context.deadline_exceeded()) {
            context.cancel();
            throw ActivityTimeoutError(deadline_message);
        }
    }

    nlohmann::json result = attempt.get();
    // 超时后才返回的结果作废
    if (context.deadline_exceeded()) {
        throw ActivityTimeoutError(deadline_message);
    }
    if (context.heartbeat_overdue()) {
        throw ActivityTimeoutError(heartbeat_message);
    }
    return result;
}

} // namespace durableflow
