#include <catch2/catch_test_macros.hpp>
#include "runtime/agent_runtime.hpp"
#include "core/error.hpp"
#include "mocks/mock_agent.hpp"
#include "mocks/mock_transport.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace agentcore;
using agentcore::testing::MockAgent;
using agentcore::testing::MockTransport;
using agentcore::testing::make_context;
using agentcore::testing::make_mock_factory;

namespace {

CoreConfig test_config() {
    CoreConfig cfg;
    cfg.shutdown.drain_timeout = std::chrono::milliseconds(500);

    DependencyBreakerConfig db;
    db.name = "database";
    db.critical = true;
    db.config.failure_threshold = 2;
    cfg.circuit_breaker.dependencies.push_back(db);

    DependencyBreakerConfig cache;
    cache.name = "cache";
    cfg.circuit_breaker.dependencies.push_back(cache);
    return cfg;
}

/// Factory that holds creation open until released.
struct GatedFactory {
    std::shared_ptr<std::atomic<bool>> entered = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> release = std::make_shared<std::atomic<bool>>(false);

    [[nodiscard]] AgentFactory factory() const {
        return [entered = entered, release = release](const AgentContext& ctx) -> std::unique_ptr<IAgent> {
            entered->store(true);
            while (!release->load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return std::make_unique<MockAgent>(ctx.agent_type, ctx);
        };
    }

    void wait_entered() const {
        while (!entered->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
};

} // anonymous namespace

TEST_CASE("AgentRuntime: init wires every component", "[runtime]") {
    AgentRuntime runtime(test_config());
    CHECK(runtime.factories() != nullptr);
    CHECK(runtime.registry() == nullptr);
    CHECK_FALSE(runtime.is_running());

    runtime.init();
    CHECK(runtime.is_running());
    REQUIRE(runtime.registry() != nullptr);
    CHECK(runtime.bridge() != nullptr);
    CHECK(runtime.lifecycle() != nullptr);
    CHECK(runtime.registry()->event_bridge() == runtime.bridge());
    CHECK(runtime.breakers()->size() == 2);
    CHECK(runtime.degradation()->list_services().size() == 2);

    CHECK_THROWS_AS(runtime.init(), std::logic_error);
}

TEST_CASE("AgentRuntime: create before init rejected", "[runtime]") {
    AgentRuntime runtime(test_config());
    runtime.factories()->register_factory("triage", make_mock_factory());
    CHECK_THROWS_AS(runtime.create_agent("alice", "triage", make_context("alice")),
                    ServiceUnavailableError);
}

TEST_CASE("AgentRuntime: breaker failures degrade agent creation", "[runtime][degradation]") {
    AgentRuntime runtime(test_config());
    runtime.factories()->register_factory("triage", make_mock_factory());
    runtime.init();

    auto db = runtime.breakers()->get_breaker("database");
    db->record_failure();
    db->record_failure();
    CHECK(runtime.degradation()->level() == DegradationLevel::DEGRADED);

    // DEGRADED still admits creation
    CHECK(runtime.create_agent("alice", "triage", make_context("alice")) != nullptr);

    runtime.breakers()->get_breaker("cache")->record_failure();
    runtime.breakers()->get_breaker("cache")->record_failure();
    runtime.breakers()->get_breaker("cache")->record_failure();
    runtime.breakers()->get_breaker("llm")->record_failure();
    runtime.breakers()->get_breaker("llm")->record_failure();
    runtime.breakers()->get_breaker("llm")->record_failure();
    CHECK(runtime.degradation()->level() == DegradationLevel::MINIMAL);
    CHECK_THROWS_AS(runtime.create_agent("bob", "researcher", make_context("bob")),
                    ServiceUnavailableError);

    runtime.breakers()->reset_all();
    CHECK(runtime.degradation()->level() == DegradationLevel::NORMAL);
}

TEST_CASE("AgentRuntime: monitoring cycle enforces ceilings", "[runtime][lifecycle]") {
    CoreConfig cfg = test_config();
    cfg.lifecycle.max_sessions = 2;
    cfg.registry.cleanup_idle_on_monitor = false;
    AgentRuntime runtime(cfg);
    runtime.factories()->register_factory("triage", make_mock_factory());
    runtime.init();

    for (const char* user : {"u1", "u2", "u3"}) {
        (void)runtime.create_agent(user, "triage", make_context(user));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    const auto report = runtime.run_monitoring_cycle();
    CHECK(report.reclaimed_sessions == 1);
    CHECK(report.idle_sessions_removed == 0);
    CHECK(report.monitoring.total_users == 2);
    CHECK(runtime.registry()->find_session("u1") == nullptr);
    CHECK(report.to_json()["degradation"]["level"] == "normal");
}

TEST_CASE("AgentRuntime: shutdown flushes events and cleans every session", "[runtime][shutdown]") {
    auto releases = std::make_shared<std::atomic<int>>(0);
    AgentRuntime runtime(test_config());
    runtime.factories()->register_factory("triage", make_mock_factory(releases));
    runtime.factories()->register_factory("researcher", make_mock_factory(releases));
    runtime.init();

    (void)runtime.create_agent("alice", "triage", make_context("alice"));
    (void)runtime.create_agent("alice", "researcher", make_context("alice"));
    (void)runtime.create_agent("bob", "triage", make_context("bob"));

    // Queued while alice is offline, delivered once she reconnects
    (void)runtime.bridge()->notify_agent_completed("alice", std::nullopt, "triage");
    auto transport = std::make_shared<MockTransport>();
    runtime.bridge()->attach_connection("alice", transport);
    CHECK(transport->sent_count() == 1);

    const auto report = runtime.shutdown();
    CHECK(report.drained);
    CHECK(report.cleanup.users_cleaned == 2);
    CHECK(report.cleanup.agents_cleaned == 3);
    CHECK(releases->load() == 3);
    CHECK_FALSE(runtime.is_running());
    CHECK(runtime.registry()->session_count() == 0);

    CHECK_THROWS_AS(runtime.create_agent("alice", "triage", make_context("alice")),
                    ServiceUnavailableError);

    // Second shutdown is a no-op
    const auto again = runtime.shutdown();
    CHECK(again.cleanup.users_cleaned == 0);
}

TEST_CASE("AgentRuntime: destructor shuts down a running runtime", "[runtime][shutdown]") {
    auto releases = std::make_shared<std::atomic<int>>(0);
    {
        AgentRuntime runtime(test_config());
        runtime.factories()->register_factory("triage", make_mock_factory(releases));
        runtime.init();
        (void)runtime.create_agent("alice", "triage", make_context("alice"));
    }
    CHECK(releases->load() == 1);
}

TEST_CASE("AgentRuntime: shutdown waits for a creation in progress", "[runtime][shutdown]") {
    CoreConfig cfg = test_config();
    cfg.shutdown.drain_timeout = std::chrono::milliseconds(5000);
    AgentRuntime runtime(cfg);
    GatedFactory gated;
    runtime.factories()->register_factory("slow", gated.factory());
    runtime.factories()->register_factory("triage", make_mock_factory());
    runtime.init();

    std::atomic<bool> created{false};
    std::thread creator([&] {
        created = runtime.create_agent("alice", "slow", make_context("alice")) != nullptr;
    });
    gated.wait_entered();
    CHECK(runtime.active_operations() == 1);

    std::atomic<bool> stopped{false};
    RuntimeShutdownReport report;
    std::thread stopper([&] {
        report = runtime.shutdown();
        stopped = true;
    });

    // Admission closes while the drain is pending
    while (runtime.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK_THROWS_AS(runtime.create_agent("bob", "triage", make_context("bob")),
                    ServiceUnavailableError);
    CHECK_THROWS_AS(runtime.reset_user("alice"), ServiceUnavailableError);
    CHECK(runtime.run_monitoring_cycle().monitoring.total_users == 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK_FALSE(stopped.load());

    gated.release->store(true);
    creator.join();
    stopper.join();

    CHECK(created.load());
    CHECK(report.drained);
    CHECK(report.in_flight_at_shutdown == 1);
    // The agent finished before cleanup, so cleanup released it
    CHECK(report.cleanup.users_cleaned == 1);
    CHECK(report.cleanup.agents_cleaned == 1);
    CHECK(runtime.active_operations() == 0);
}

TEST_CASE("AgentRuntime: drain gives up after the configured timeout", "[runtime][shutdown]") {
    CoreConfig cfg = test_config();
    cfg.shutdown.drain_timeout = std::chrono::milliseconds(50);
    AgentRuntime runtime(cfg);
    GatedFactory gated;
    runtime.factories()->register_factory("slow", gated.factory());
    runtime.init();

    std::thread creator([&] {
        (void)runtime.create_agent("alice", "slow", make_context("alice"));
    });
    gated.wait_entered();
    // Cleanup of alice's session waits for her creation to finish
    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        gated.release->store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    const auto report = runtime.shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    releaser.join();
    creator.join();

    CHECK_FALSE(report.drained);
    CHECK(report.in_flight_at_shutdown == 1);
    CHECK(elapsed >= std::chrono::milliseconds(40));
    CHECK(report.cleanup.agents_cleaned == 1);
    CHECK_FALSE(runtime.is_running());
    CHECK(runtime.active_operations() == 0);
}

TEST_CASE("AgentRuntime: reset and cleanup pass through while running", "[runtime]") {
    auto releases = std::make_shared<std::atomic<int>>(0);
    AgentRuntime runtime(test_config());
    runtime.factories()->register_factory("triage", make_mock_factory(releases));
    CHECK_THROWS_AS(runtime.cleanup_user("alice"), ServiceUnavailableError);
    runtime.init();

    (void)runtime.create_agent("alice", "triage", make_context("alice"));
    CHECK(runtime.reset_user("alice").agents_reset == 1);
    (void)runtime.create_agent("alice", "triage", make_context("alice"));
    CHECK(runtime.cleanup_user("alice").cleaned_agents == 1);
    CHECK(releases->load() == 2);
    CHECK(runtime.registry()->session_count() == 0);
    CHECK(runtime.active_operations() == 0);
}
