// tests/test_substrate.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_helpers.h"
#include "common/errors.h"
#include "modules/substrate/execution_host.h"
#include "modules/substrate/history_store.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace durableflow;
using Catch::Matchers::ContainsSubstring;
using durableflow::testing::quick_options;
using durableflow::testing::wait_for_query;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

size_t count_events(const ExecutionHistory& history, HistoryEventType type) {
    size_t count = 0;
    for (const auto& event : history.events) {
        if (event.type == type) ++count;
    }
    return count;
}

// prepare -> wait for "release" -> finish
json two_step_workflow(ExecutionSession& session, const json& input) {
    json prepared = session.execute_activity("prepare", quick_options(), input);
    bool released = false;
    session.set_signal_handler("release", [&released](const json&) { released = true; });
    session.set_query_handler("ready", [] { return json(true); });
    session.await_condition([&released] { return released; }, kNoTimeout);
    json finished = session.execute_activity("finish", quick_options(), prepared);
    return json{{"prepared", prepared}, {"finished", finished}};
}

} // namespace

TEST_CASE("Activity result becomes the workflow result", "[substrate]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("double", [](ActivityContext&, const json& input) {
        return json(input.get<int>() * 2);
    });
    host.register_workflow("doubler", [](ExecutionSession& session, const json& input) {
        return session.execute_activity("double", quick_options(), input.at("value"));
    });

    host.start("exec-1", "doubler", json{{"value", 21}});
    auto outcome = host.wait_result("exec-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "completed");
    REQUIRE(outcome->at("result") == 42);

    auto history = host.store().load("exec-1");
    REQUIRE(history.has_value());
    REQUIRE(history->closed);
    REQUIRE(count_events(*history, HistoryEventType::ACTIVITY_COMPLETED) == 1);
}

TEST_CASE("Retries follow maximum_attempts", "[substrate][retry]") {
    std::atomic<int> calls{0};
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("flaky", [&calls](ActivityContext& ctx, const json&) {
        if (++calls < 3) {
            throw ExecutorError("transient failure");
        }
        return json{{"attempt", ctx.attempt()}};
    });
    host.register_workflow("retrying", [](ExecutionSession& session, const json& input) {
        try {
            json result = session.execute_activity("flaky", quick_options(input.at("max").get<int>()), nullptr);
            return json{{"ok", true}, {"result", result}};
        } catch (const ActivityFailure& e) {
            return json{{"ok", false}, {"attempts", e.attempts()}, {"kind", e.cause_kind()}};
        }
    });

    SECTION("third attempt succeeds under maximum_attempts=3") {
        host.start("retry-3", "retrying", json{{"max", 3}});
        auto outcome = host.wait_result("retry-3", 5s);
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->at("result").at("ok") == true);
        REQUIRE(outcome->at("result").at("result").at("attempt") == 3);
        REQUIRE(calls == 3);
    }

    SECTION("gives up after two attempts under maximum_attempts=2") {
        host.start("retry-2", "retrying", json{{"max", 2}});
        auto outcome = host.wait_result("retry-2", 5s);
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->at("result").at("ok") == false);
        REQUIRE(outcome->at("result").at("attempts") == 2);
        REQUIRE(outcome->at("result").at("kind") == "ExecutorError");
        REQUIRE(calls == 2);
    }
}

TEST_CASE("Non-retryable errors fail on the first attempt", "[substrate][retry]") {
    std::atomic<int> calls{0};
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("config", [&calls](ActivityContext&, const json&) -> json {
        ++calls;
        throw ConfigError("bad config");
    });
    host.register_activity("listed", [&calls](ActivityContext&, const json&) -> json {
        ++calls;
        throw ExecutorError("listed as non-retryable");
    });
    host.register_workflow("failing", [](ExecutionSession& session, const json& input) {
        ActivityOptions options = quick_options(5);
        options.retry.non_retryable_errors = {"ExecutorError"};
        try {
            session.execute_activity(input.get<std::string>(), options, nullptr);
            return json{{"ok", true}};
        } catch (const ActivityFailure& e) {
            return json{{"ok", false}, {"attempts", e.attempts()}, {"kind", e.cause_kind()}};
        }
    });

    host.start("config-1", "failing", "config");
    auto outcome = host.wait_result("config-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result").at("attempts") == 1);
    REQUIRE(outcome->at("result").at("kind") == "ConfigError");

    host.start("listed-1", "failing", "listed");
    outcome = host.wait_result("listed-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result").at("attempts") == 1);
    REQUIRE(calls == 2);
}

TEST_CASE("Unregistered activity surfaces as ActivityFailure", "[substrate]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_workflow("lonely", [](ExecutionSession& session, const json&) {
        try {
            session.execute_activity("missing", quick_options(), nullptr);
            return json("unreachable");
        } catch (const ActivityFailure& e) {
            return json(e.cause_kind());
        }
    });
    host.start("lonely-1", "lonely", nullptr);
    auto outcome = host.wait_result("lonely-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result") == "ActivityNotRegistered");
}

TEST_CASE("Activity past its deadline fails with ActivityTimeoutError", "[substrate][retry]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("slow", [](ActivityContext&, const json&) {
        std::this_thread::sleep_for(30ms);
        return json("too late");
    });
    host.register_workflow("timed", [](ExecutionSession& session, const json&) {
        ActivityOptions options = quick_options(1);
        options.start_to_close_timeout = 5ms;
        try {
            return session.execute_activity("slow", options, nullptr);
        } catch (const ActivityFailure& e) {
            return json(e.cause_kind());
        }
    });
    host.start("timed-1", "timed", nullptr);
    auto outcome = host.wait_result("timed-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result") == "ActivityTimeoutError");
}

TEST_CASE("A hung activity is abandoned at its deadline", "[substrate][retry]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("hang", [](ActivityContext& ctx, const json&) {
        while (!ctx.cancelled()) {
            std::this_thread::sleep_for(5ms);
        }
        return json("abandoned");
    });
    host.register_workflow("hanging", [](ExecutionSession& session, const json&) {
        ActivityOptions options = quick_options(1);
        options.start_to_close_timeout = 100ms;
        try {
            return session.execute_activity("hang", options, nullptr);
        } catch (const ActivityFailure& e) {
            return json{{"kind", e.cause_kind()}, {"attempts", e.attempts()}};
        }
    });

    const auto started = std::chrono::steady_clock::now();
    host.start("hang-1", "hanging", nullptr);
    auto outcome = host.wait_result("hang-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    REQUIRE(outcome->at("result").at("kind") == "ActivityTimeoutError");
    REQUIRE(outcome->at("result").at("attempts") == 1);
}

TEST_CASE("An activity that stops heartbeating times out", "[substrate][retry]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("silent", [](ActivityContext& ctx, const json&) {
        while (!ctx.cancelled()) {
            std::this_thread::sleep_for(5ms);
        }
        return json("abandoned");
    });
    host.register_activity("steady", [](ActivityContext& ctx, const json&) {
        for (int i = 0; i < 10; ++i) {
            std::this_thread::sleep_for(30ms);
            ctx.heartbeat(json{{"step", i}});
        }
        return json("steady");
    });
    host.register_workflow("heartbeats", [](ExecutionSession& session, const json& input) {
        ActivityOptions options = quick_options(1);
        options.heartbeat_timeout = 200ms;
        try {
            return json{{"result", session.execute_activity(input.get<std::string>(), options, nullptr)}};
        } catch (const ActivityFailure& e) {
            return json{{"kind", e.cause_kind()}, {"error", e.what()}};
        }
    });

    host.start("silent-1", "heartbeats", "silent");
    auto silent = host.wait_result("silent-1", 5s);
    REQUIRE(silent.has_value());
    REQUIRE(silent->at("result").at("kind") == "ActivityTimeoutError");
    REQUIRE_THAT(silent->at("result").at("error").get<std::string>(), ContainsSubstring("heartbeat"));

    // 持续心跳的 activity 总时长可以超过 heartbeat 超时
    host.start("steady-1", "heartbeats", "steady");
    auto steady = host.wait_result("steady-1", 5s);
    REQUIRE(steady.has_value());
    REQUIRE(steady->at("result") == json{{"result", "steady"}});
}

TEST_CASE("A timed-out attempt is retried", "[substrate][retry]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("flaky", [](ActivityContext& ctx, const json&) {
        if (ctx.attempt() == 1) {
            while (!ctx.cancelled()) {
                std::this_thread::sleep_for(5ms);
            }
        }
        return json(ctx.attempt());
    });
    host.register_workflow("retrying", [](ExecutionSession& session, const json&) {
        ActivityOptions options = quick_options(2);
        options.start_to_close_timeout = 100ms;
        return session.execute_activity("flaky", options, nullptr);
    });

    host.start("flaky-1", "retrying", nullptr);
    auto outcome = host.wait_result("flaky-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "completed");
    REQUIRE(outcome->at("result") == 2);
}

TEST_CASE("Heartbeat details carry over to the next attempt", "[substrate][retry]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("resumable", [](ActivityContext& ctx, const json&) {
        if (ctx.attempt() == 1) {
            ctx.heartbeat(json{{"processed", 5}});
            throw ExecutorError("interrupted");
        }
        return ctx.heartbeat_details();
    });
    host.register_workflow("resuming", [](ExecutionSession& session, const json&) {
        return session.execute_activity("resumable", quick_options(), nullptr);
    });
    host.start("hb-1", "resuming", nullptr);
    auto outcome = host.wait_result("hb-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result").at("processed") == 5);
}

TEST_CASE("Durable timer fires after the requested delay", "[substrate][timer]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_workflow("sleeper", [](ExecutionSession& session, const json&) {
        session.sleep(50ms);
        return json(true);
    });

    const auto started = std::chrono::steady_clock::now();
    host.start("sleep-1", "sleeper", nullptr);
    auto outcome = host.wait_result("sleep-1", 5s);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "completed");
    REQUIRE(elapsed >= 50ms);

    auto history = host.store().load("sleep-1");
    REQUIRE(count_events(*history, HistoryEventType::TIMER_STARTED) == 1);
    REQUIRE(count_events(*history, HistoryEventType::TIMER_FIRED) == 1);
}

TEST_CASE("Resumed execution does not re-invoke completed activities", "[substrate][replay]") {
    auto store = std::make_shared<InMemoryHistoryStore>();
    std::atomic<int> prepare_calls{0};
    std::atomic<int> finish_calls{0};
    auto register_all = [&](ExecutionHost& host) {
        host.register_activity("prepare", [&prepare_calls](ActivityContext&, const json& input) {
            ++prepare_calls;
            return json{{"prepared", input.at("value")}};
        });
        host.register_activity("finish", [&finish_calls](ActivityContext&, const json& input) {
            ++finish_calls;
            return input.at("prepared");
        });
        host.register_workflow("twoStep", two_step_workflow);
    };

    {
        ExecutionHost first(store);
        register_all(first);
        first.start("exec-1", "twoStep", json{{"value", 7}});
        wait_for_query(first, "exec-1", "ready");
        first.stop();
        REQUIRE_FALSE(first.wait_result("exec-1", 1s).has_value());
    }
    REQUIRE(store->list_open() == std::vector<std::string>{"exec-1"});
    REQUIRE(prepare_calls == 1);

    ExecutionHost second(store);
    register_all(second);
    REQUIRE(second.resume_pending() == std::vector<std::string>{"exec-1"});
    wait_for_query(second, "exec-1", "ready");
    second.signal("exec-1", "release", nullptr);

    auto outcome = second.wait_result("exec-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "completed");
    REQUIRE(outcome->at("result").at("finished") == 7);
    REQUIRE(prepare_calls == 1);
    REQUIRE(finish_calls == 1);
    REQUIRE(store->list_open().empty());
}

TEST_CASE("Timers replay without being re-armed", "[substrate][timer][replay]") {
    auto store = std::make_shared<InMemoryHistoryStore>();
    auto workflow = [](ExecutionSession& session, const json&) {
        session.sleep(20ms);
        bool go = false;
        session.set_signal_handler("go", [&go](const json&) { go = true; });
        session.set_query_handler("ready", [] { return json(true); });
        session.await_condition([&go] { return go; }, kNoTimeout);
        return json("done");
    };

    {
        ExecutionHost first(store);
        first.register_workflow("timerThenSignal", workflow);
        first.start("timer-1", "timerThenSignal", nullptr);
        wait_for_query(first, "timer-1", "ready");
        first.stop();
    }

    ExecutionHost second(store);
    second.register_workflow("timerThenSignal", workflow);
    second.resume_pending();
    wait_for_query(second, "timer-1", "ready");
    second.signal("timer-1", "go", nullptr);
    auto outcome = second.wait_result("timer-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result") == "done");

    auto history = store->load("timer-1");
    REQUIRE(count_events(*history, HistoryEventType::TIMER_STARTED) == 1);
    REQUIRE(count_events(*history, HistoryEventType::TIMER_FIRED) == 1);
}

TEST_CASE("Diverging replay fails with NonDeterminismError", "[substrate][replay]") {
    auto store = std::make_shared<InMemoryHistoryStore>();
    {
        ExecutionHost first(store);
        first.register_activity("alpha", [](ActivityContext&, const json&) { return json(1); });
        first.register_workflow("changing", [](ExecutionSession& session, const json&) {
            session.execute_activity("alpha", quick_options(), nullptr);
            session.set_query_handler("ready", [] { return json(true); });
            session.sleep(10min);
            return json("never");
        });
        first.start("diverge-1", "changing", nullptr);
        wait_for_query(first, "diverge-1", "ready");
        first.stop();
    }

    ExecutionHost second(store);
    second.register_activity("beta", [](ActivityContext&, const json&) { return json(2); });
    second.register_workflow("changing", [](ExecutionSession& session, const json&) {
        return session.execute_activity("beta", quick_options(), nullptr);
    });
    second.resume_pending();
    auto outcome = second.wait_result("diverge-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "failed");
    REQUIRE(outcome->at("kind") == "NonDeterminismError");
}

TEST_CASE("Continue-as-new keeps the execution id", "[substrate]") {
    std::atomic<int> ticks{0};
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_activity("tick", [&ticks](ActivityContext&, const json&) { return json(++ticks); });
    host.register_workflow("counter", [](ExecutionSession& session, const json& input) {
        const int n = input.value("n", 0);
        session.execute_activity("tick", quick_options(), nullptr);
        if (n < 2) {
            session.continue_as_new(json{{"n", n + 1}});
        }
        return json{{"n", n}, {"run", session.run_number()}};
    });

    host.start("counter-1", "counter", json::object());
    auto outcome = host.wait_result("counter-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result").at("n") == 2);
    REQUIRE(outcome->at("result").at("run") == 3);
    REQUIRE(ticks == 3);

    auto history = host.store().load("counter-1");
    REQUIRE(history->run_number == 3);
    REQUIRE(history->events.size() == 1);
}

TEST_CASE("Signals sent before a handler exists are buffered in order", "[substrate][signal]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_workflow("collector", [](ExecutionSession& session, const json&) {
        session.sleep(20ms);
        json received = json::array();
        session.set_signal_handler("item", [&received](const json& payload) { received.push_back(payload); });
        session.await_condition([&received] { return received.size() == 2; }, 5s);
        return received;
    });

    host.start("collect-1", "collector", nullptr);
    host.signal("collect-1", "item", "first");
    host.signal("collect-1", "item", "second");

    auto outcome = host.wait_result("collect-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("result") == json::array({"first", "second"}));
}

TEST_CASE("Host rejects unknown executions and workflow types", "[substrate]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    REQUIRE_THROWS_AS(host.start("x", "nope", nullptr), ConfigError);
    REQUIRE_THROWS_AS(host.query("x", "anything"), ExecutionStateError);
    REQUIRE_THROWS_AS(host.signal("x", "anything", nullptr), ExecutionStateError);
    REQUIRE_THROWS_AS(host.wait_result("x", 1ms), ExecutionStateError);
}

TEST_CASE("Workflow exceptions close the execution as failed", "[substrate]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_workflow("broken", [](ExecutionSession&, const json&) -> json {
        throw ConfigError("no such agent");
    });
    host.start("broken-1", "broken", nullptr);
    auto outcome = host.wait_result("broken-1", 5s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "failed");
    REQUIRE(outcome->at("kind") == "ConfigError");
    REQUIRE(outcome->at("error") == "no such agent");

    // 已关闭的执行不再接收信号
    REQUIRE_THROWS_AS(host.signal("broken-1", "late", nullptr), ExecutionStateError);
}

TEST_CASE("FileHistoryStore survives a reload", "[substrate][history]") {
    durableflow::testing::TempDir dir("durableflow-history");
    {
        FileHistoryStore store(dir.path());
        store.create("file-1", "twoStep", json{{"value", 1}});
        store.append_event("file-1", HistoryEvent{HistoryEventType::ACTIVITY_COMPLETED, "prepare", json{{"result", 1}}});
        REQUIRE(store.enqueue_signal("file-1", "release", json{{"by", "test"}}) == 1);
        store.create("file-2", "twoStep", nullptr);
        store.close("file-2", json{{"status", "completed"}, {"result", nullptr}});
    }

    FileHistoryStore reloaded(dir.path());
    auto history = reloaded.load("file-1");
    REQUIRE(history.has_value());
    REQUIRE(history->workflow_type == "twoStep");
    REQUIRE(history->events.size() == 1);
    REQUIRE(history->events[0].type == HistoryEventType::ACTIVITY_COMPLETED);
    REQUIRE(history->events[0].name == "prepare");
    REQUIRE(reloaded.pending_signals("file-1").size() == 1);
    REQUIRE(reloaded.list_open() == std::vector<std::string>{"file-1"});

    reloaded.ack_signals("file-1", 1);
    REQUIRE(reloaded.pending_signals("file-1").empty());
    REQUIRE(reloaded.enqueue_signal("file-1", "release", nullptr) == 2);
}

TEST_CASE("Retry backoff grows geometrically up to the cap", "[substrate][retry]") {
    RetryPolicy policy;
    policy.initial_interval = 100ms;
    policy.backoff_coefficient = 2.0;
    policy.maximum_interval = 350ms;
    REQUIRE(policy.delay_before_attempt(1) == 0ms);
    REQUIRE(policy.delay_before_attempt(2) == 100ms);
    REQUIRE(policy.delay_before_attempt(3) == 200ms);
    REQUIRE(policy.delay_before_attempt(4) == 350ms);

    policy.maximum_attempts = 0;
    REQUIRE(policy.has_attempts_left(1000));
}

TEST_CASE("Finished executions release their slots and threads", "[substrate]") {
    ExecutionHost host(std::make_shared<InMemoryHistoryStore>());
    host.register_workflow("echo", [](ExecutionSession&, const json& input) { return input; });

    for (int i = 0; i < 200; ++i) {
        const std::string id = "echo-" + std::to_string(i);
        host.start(id, "echo", json(i));
        auto outcome = host.wait_result(id, 5s);
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->at("result") == i);
    }

    REQUIRE(durableflow::testing::eventually([&host] { return host.live_executions() == 0; }));
    // 最后一两个线程要等下一次 launch 或 stop 才 join
    REQUIRE(host.retained_threads() <= 2);

    auto earlier = host.wait_result("echo-7", 1s);
    REQUIRE(earlier.has_value());
    REQUIRE(earlier->at("status") == "completed");
    REQUIRE(earlier->at("result") == 7);

    host.stop();
    REQUIRE(host.retained_threads() == 0);
}

TEST_CASE("FileHistoryStore keeps ids that differ only in punctuation apart", "[substrate][history]") {
    durableflow::testing::TempDir dir("durableflow-ids");
    {
        FileHistoryStore store(dir.path());
        store.create("a/b", "wf", json(1));
        store.create("a_b", "wf", json(2));
        store.create("a.b", "wf", json(3));
        store.create("../escape", "wf", json(4));
    }

    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        if (entry.path().extension() == ".json") ++files;
    }
    REQUIRE(files == 4);

    FileHistoryStore reloaded(dir.path());
    REQUIRE(reloaded.load("a/b")->input == 1);
    REQUIRE(reloaded.load("a_b")->input == 2);
    REQUIRE(reloaded.load("a.b")->input == 3);
    REQUIRE(reloaded.load("../escape")->input == 4);
    REQUIRE(reloaded.list_open() == std::vector<std::string>{"../escape", "a.b", "a/b", "a_b"});
}
