// modules/substrate/history_store.cpp
#include "modules/substrate/history_store.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace durableflow {

std::string to_string(HistoryEventType type) {
    switch (type) {
        case HistoryEventType::ACTIVITY_COMPLETED: return "ActivityCompleted";
        case HistoryEventType::ACTIVITY_FAILED:    return "ActivityFailed";
        case HistoryEventType::TIMER_STARTED:      return "TimerStarted";
        case HistoryEventType::TIMER_FIRED:        return "TimerFired";
        case HistoryEventType::CONDITION_STARTED:  return "ConditionStarted";
        case HistoryEventType::CONDITION_RESOLVED: return "ConditionResolved";
        case HistoryEventType::SIGNAL_RECEIVED:    return "SignalReceived";
        case HistoryEventType::SIDE_EFFECT:        return "SideEffect";
    }
    return "SideEffect";
}

HistoryEventType parse_history_event_type(const std::string& value) {
    static const std::unordered_map<std::string, HistoryEventType> kTypes = {
        {"ActivityCompleted", HistoryEventType::ACTIVITY_COMPLETED},
        {"ActivityFailed", HistoryEventType::ACTIVITY_FAILED},
        {"TimerStarted", HistoryEventType::TIMER_STARTED},
        {"TimerFired", HistoryEventType::TIMER_FIRED},
        {"ConditionStarted", HistoryEventType::CONDITION_STARTED},
        {"ConditionResolved", HistoryEventType::CONDITION_RESOLVED},
        {"SignalReceived", HistoryEventType::SIGNAL_RECEIVED},
        {"SideEffect", HistoryEventType::SIDE_EFFECT},
    };
    auto it = kTypes.find(value);
    if (it == kTypes.end()) {
        throw ConfigError("Unknown history event type '" + value + "'");
    }
    return it->second;
}

void to_json(nlohmann::json& j, const HistoryEvent& event) {
    j = nlohmann::json{{"type", to_string(event.type)}, {"name", event.name}, {"payload", event.payload}};
}

void from_json(const nlohmann::json& j, HistoryEvent& event) {
    event.type = parse_history_event_type(j.at("type").get<std::string>());
    event.name = j.value("name", std::string{});
    event.payload = j.contains("payload") ? j.at("payload") : nlohmann::json::object();
}

void to_json(nlohmann::json& j, const SignalRecord& signal) {
    j = nlohmann::json{{"id", signal.id}, {"name", signal.name}, {"payload", signal.payload}};
}

void from_json(const nlohmann::json& j, SignalRecord& signal) {
    signal.id = j.at("id").get<int64_t>();
    signal.name = j.at("name").get<std::string>();
    signal.payload = j.contains("payload") ? j.at("payload") : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ExecutionHistory& history) {
    j = nlohmann::json{
        {"execution_id", history.execution_id},
        {"workflow_type", history.workflow_type},
        {"run_number", history.run_number},
        {"input", history.input},
        {"events", history.events},
        {"inbox", history.inbox},
        {"next_signal_id", history.next_signal_id},
        {"closed", history.closed},
        {"outcome", history.outcome}
    };
}

void from_json(const nlohmann::json& j, ExecutionHistory& history) {
    history.execution_id = j.at("execution_id").get<std::string>();
    history.workflow_type = j.at("workflow_type").get<std::string>();
    history.run_number = j.value("run_number", 1);
    history.input = j.contains("input") ? j.at("input") : nlohmann::json(nullptr);
    history.events = j.value("events", std::vector<HistoryEvent>{});
    history.inbox = j.value("inbox", std::vector<SignalRecord>{});
    history.next_signal_id = j.value("next_signal_id", int64_t{1});
    history.closed = j.value("closed", false);
    history.outcome = j.contains("outcome") ? j.at("outcome") : nlohmann::json(nullptr);
}

// --- InMemoryHistoryStore ---

ExecutionHistory& InMemoryHistoryStore::require_locked(const std::string& execution_id) {
    auto it = histories_.find(execution_id);
    if (it == histories_.end()) {
        throw ExecutionStateError("Unknown execution: " + execution_id);
    }
    return it->second;
}

void InMemoryHistoryStore::persist_locked(const ExecutionHistory&) {}

void InMemoryHistoryStore::create(const std::string& execution_id,
                                  const std::string& workflow_type,
                                  const nlohmann::json& input) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (histories_.count(execution_id) > 0) {
        throw ConfigError("Execution id already in use: " + execution_id);
    }
    ExecutionHistory history;
    history.execution_id = execution_id;
    history.workflow_type = workflow_type;
    history.input = input;
    auto& stored = histories_.emplace(execution_id, std::move(history)).first->second;
    order_.push_back(execution_id);
    persist_locked(stored);
}

void InMemoryHistoryStore::start_new_run(const std::string& execution_id, const nlohmann::json& input) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = require_locked(execution_id);
    history.run_number += 1;
    history.input = input;
    history.events.clear();
    persist_locked(history);
}

void InMemoryHistoryStore::append_event(const std::string& execution_id, const HistoryEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = require_locked(execution_id);
    if (history.closed) {
        throw ExecutionStateError("Execution already closed: " + execution_id);
    }
    history.events.push_back(event);
    persist_locked(history);
}

void InMemoryHistoryStore::close(const std::string& execution_id, const nlohmann::json& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = require_locked(execution_id);
    history.closed = true;
    history.outcome = outcome;
    persist_locked(history);
}

std::optional<ExecutionHistory> InMemoryHistoryStore::load(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(execution_id);
    if (it == histories_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryHistoryStore::list_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> open;
    for (const auto& id : order_) {
        auto it = histories_.find(id);
        if (it != histories_.end() && !it->second.closed) {
            open.push_back(id);
        }
    }
    return open;
}

int64_t InMemoryHistoryStore::enqueue_signal(const std::string& execution_id,
                                             const std::string& signal_name,
                                             const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = require_locked(execution_id);
    if (history.closed) {
        throw ExecutionStateError("Cannot signal closed execution: " + execution_id);
    }
    SignalRecord record{history.next_signal_id++, signal_name, payload};
    history.inbox.push_back(record);
    persist_locked(history);
    return record.id;
}

std::vector<SignalRecord> InMemoryHistoryStore::pending_signals(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(execution_id);
    if (it == histories_.end()) return {};
    return it->second.inbox;
}

void InMemoryHistoryStore::ack_signals(const std::string& execution_id, int64_t up_to_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = require_locked(execution_id);
    auto& inbox = history.inbox;
    inbox.erase(std::remove_if(inbox.begin(), inbox.end(),
                               [up_to_id](const SignalRecord& s) { return s.id <= up_to_id; }),
                inbox.end());
    persist_locked(history);
}

// --- FileHistoryStore ---

FileHistoryStore::FileHistoryStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw ConfigError("Cannot create history directory '" + directory_.string() + "': " + ec.message());
    }
    load_all();
}

std::filesystem::path FileHistoryStore::path_for(const std::string& execution_id) const {
    // %XX 编码，保证不同 id 映射到不同文件名
    static const char kHex[] = "0123456789ABCDEF";
    std::string safe;
    safe.reserve(execution_id.size());
    for (char c : execution_id) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '_') {
            safe.push_back(c);
        } else {
            safe.push_back('%');
            safe.push_back(kHex[byte >> 4]);
            safe.push_back(kHex[byte & 0x0F]);
        }
    }
    return directory_ / (safe + ".json");
}

void FileHistoryStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionHistory> loaded;
    for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        std::ifstream file(entry.path());
        if (!file.is_open()) {
            throw ConfigError("Cannot open history file: " + entry.path().string());
        }
        try {
            nlohmann::json j;
            file >> j;
            loaded.push_back(j.get<ExecutionHistory>());
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Corrupt history file '" + entry.path().string() + "': " + e.what());
        }
    }
    // directory order is unspecified; fall back to id order for list_open()
    std::sort(loaded.begin(), loaded.end(),
              [](const ExecutionHistory& a, const ExecutionHistory& b) { return a.execution_id < b.execution_id; });
    for (auto& history : loaded) {
        order_.push_back(history.execution_id);
        histories_.emplace(history.execution_id, std::move(history));
    }
    DF_LOG_DEBUG("[HistoryStore] Loaded {} executions from {}", histories_.size(), directory_.string());
}

void FileHistoryStore::persist_locked(const ExecutionHistory& history) {
    const auto target = path_for(history.execution_id);
    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw ExecutionStateError("Cannot write history file: " + tmp.string());
        }
        out << nlohmann::json(history).dump();
        if (!out.good()) {
            throw ExecutionStateError("Failed writing history file: " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw ExecutionStateError("Cannot replace history file '" + target.string() + "': " + ec.message());
    }
}

} // namespace durableflow
