#include <catch2/catch_test_macros.hpp>
#include "events/event_bridge.hpp"
#include "events/event_sanitizer.hpp"
#include "events/user_event_emitter.hpp"
#include "resilience/degradation_manager.hpp"
#include "core/error.hpp"
#include "mocks/mock_transport.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agentcore;
using agentcore::testing::MockTransport;

namespace {

Event progress_event(const std::string& user, int step) {
    return Event::make(EventType::PROGRESS_UPDATE, user, {{"step", step}}, std::string("thread-1"));
}

class ThrowingTransport : public IEventTransport {
public:
    [[nodiscard]] bool send(const Event&, std::chrono::milliseconds) override {
        throw std::runtime_error("socket closed");
    }
    [[nodiscard]] std::string name() const override { return "throwing"; }
};

/// Transport that reports its own service down to the degradation manager
/// from inside send() once armed, as a websocket watcher would.
class SelfReportingTransport : public IEventTransport {
public:
    SelfReportingTransport(std::shared_ptr<DegradationManager> degradation, std::string service)
        : degradation_(std::move(degradation)), service_(std::move(service)) {}

    [[nodiscard]] bool send(const Event&, std::chrono::milliseconds) override {
        ++attempts;
        if (armed) {
            degradation_->set_service_status(service_, false);
            return false;
        }
        return true;
    }
    [[nodiscard]] std::string name() const override { return "self-reporting"; }

    std::atomic<bool> armed{false};
    std::atomic<int> attempts{0};

private:
    std::shared_ptr<DegradationManager> degradation_;
    std::string service_;
};

} // anonymous namespace

TEST_CASE("EventBridge: delivers immediately with healthy connection", "[events][bridge]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("alice", transport);

    CHECK(bridge.emit("alice", progress_event("alice", 1)) == DeliveryOutcome::DELIVERED);
    REQUIRE(transport->sent_count() == 1);
    CHECK(transport->sent()[0].user_id == "alice");
    CHECK(bridge.queued_count("alice") == 0);
}

TEST_CASE("EventBridge: queues without a connection", "[events][bridge]") {
    EventBridge bridge;
    CHECK(bridge.emit("alice", progress_event("alice", 1)) == DeliveryOutcome::QUEUED);
    CHECK(bridge.queued_count("alice") == 1);
    CHECK_FALSE(bridge.has_connection("alice"));
}

TEST_CASE("EventBridge: pending events flushed in order before newer event", "[events][bridge]") {
    auto degradation = std::make_shared<DegradationManager>();
    degradation->register_service("websocket");
    EventBridge bridge(EventBridge::Config{}, degradation);

    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("alice", transport);

    degradation->set_service_status("websocket", false);
    for (int i = 1; i <= 5; ++i) {
        CHECK(bridge.emit("alice", progress_event("alice", i)) == DeliveryOutcome::QUEUED);
    }
    CHECK(transport->sent_count() == 0);
    CHECK(bridge.queued_count("alice") == 5);

    // Recovery flushes through the degradation listener
    degradation->set_service_status("websocket", true);
    CHECK(bridge.queued_count("alice") == 0);

    CHECK(bridge.emit("alice", progress_event("alice", 6)) == DeliveryOutcome::DELIVERED);

    const auto sent = transport->sent();
    REQUIRE(sent.size() == 6);
    for (int i = 0; i < 6; ++i) {
        CHECK(sent[i].payload["step"] == i + 1);
    }
}

TEST_CASE("EventBridge: newer event waits behind pending ones", "[events][bridge]") {
    EventBridge bridge;
    for (int i = 1; i <= 3; ++i) {
        (void)bridge.emit("bob", progress_event("bob", i));
    }

    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("bob", transport);
    CHECK(transport->sent_count() == 3);

    (void)bridge.emit("bob", progress_event("bob", 4));
    const auto sent = transport->sent();
    REQUIRE(sent.size() == 4);
    CHECK(sent[3].payload["step"] == 4);
}

TEST_CASE("EventBridge: overflow evicts oldest and sends truncation marker first", "[events][bridge]") {
    EventBridge::Config cfg;
    cfg.queue_capacity = 3;
    EventBridge bridge(cfg);

    for (int i = 1; i <= 5; ++i) {
        CHECK(bridge.emit("carol", progress_event("carol", i)) == DeliveryOutcome::QUEUED);
    }
    CHECK(bridge.queued_count("carol") == 3);
    REQUIRE(bridge.channel_stats("carol").has_value());
    CHECK(bridge.channel_stats("carol")->evicted == 2);

    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("carol", transport);

    const auto sent = transport->sent();
    REQUIRE(sent.size() == 4);
    CHECK(sent[0].type == EventType::HISTORY_TRUNCATED);
    CHECK(sent[0].payload["dropped_events"] == 2);
    CHECK(sent[0].thread_id == std::optional<std::string>("thread-1"));
    CHECK(sent[1].payload["step"] == 3);
    CHECK(sent[2].payload["step"] == 4);
    CHECK(sent[3].payload["step"] == 5);

    // Marker not repeated on the next flush
    (void)bridge.emit("carol", progress_event("carol", 6));
    CHECK(transport->sent_count() == 5);
}

TEST_CASE("EventBridge: event for another user rejected", "[events][bridge][isolation]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("alice", transport);

    CHECK_THROWS_AS(bridge.emit("alice", progress_event("mallory", 1)), IsolationViolationError);
    CHECK(transport->sent_count() == 0);
    CHECK(bridge.queued_count("alice") == 0);
}

TEST_CASE("EventBridge: empty user id rejected", "[events][bridge]") {
    EventBridge bridge;
    CHECK_THROWS_AS(bridge.emit("", progress_event("", 1)), ContextValidationError);
}

TEST_CASE("EventBridge: event without user id stamped with channel user", "[events][bridge]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("dave", transport);

    Event e;
    e.type = EventType::CUSTOM;
    CHECK(bridge.emit("dave", e) == DeliveryOutcome::DELIVERED);
    REQUIRE(transport->sent_count() == 1);
    CHECK(transport->sent()[0].user_id == "dave");
    CHECK(transport->sent()[0].timestamp != SystemTime{});
}

TEST_CASE("EventBridge: failed send marks transport unhealthy and queues", "[events][bridge]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("erin", transport);

    transport->set_fail(true);
    CHECK(bridge.emit("erin", progress_event("erin", 1)) == DeliveryOutcome::QUEUED);
    CHECK(transport->send_attempts() == 1);

    // Unhealthy: no further synchronous attempts
    CHECK(bridge.emit("erin", progress_event("erin", 2)) == DeliveryOutcome::QUEUED);
    CHECK(transport->send_attempts() == 1);

    auto stats = bridge.channel_stats("erin");
    REQUIRE(stats.has_value());
    CHECK_FALSE(stats->transport_healthy);
    CHECK(stats->send_failures == 1);
    CHECK(stats->pending == 2);

    transport->set_fail(false);
    bridge.set_transport_healthy("erin", true);
    CHECK(bridge.queued_count("erin") == 0);
    CHECK(transport->sent_count() == 2);
}

TEST_CASE("EventBridge: throwing transport treated as failed send", "[events][bridge]") {
    EventBridge bridge;
    bridge.attach_connection("frank", std::make_shared<ThrowingTransport>());

    CHECK(bridge.emit("frank", progress_event("frank", 1)) == DeliveryOutcome::QUEUED);
    CHECK(bridge.get_stats().send_failures == 1);
}

TEST_CASE("EventBridge: detach queues later events", "[events][bridge]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("gina", transport);
    bridge.detach_connection("gina");

    CHECK(bridge.emit("gina", progress_event("gina", 1)) == DeliveryOutcome::QUEUED);
    CHECK(transport->sent_count() == 0);
    CHECK(bridge.flush("gina") == 0);
}

TEST_CASE("EventBridge: channels are independent per user", "[events][bridge][isolation]") {
    EventBridge bridge;
    auto a = std::make_shared<MockTransport>("a");
    auto b = std::make_shared<MockTransport>("b");
    bridge.attach_connection("alice", a);
    bridge.attach_connection("bob", b);

    b->set_fail(true);
    (void)bridge.emit("bob", progress_event("bob", 1));
    CHECK(bridge.emit("alice", progress_event("alice", 1)) == DeliveryOutcome::DELIVERED);

    CHECK(a->sent_count() == 1);
    CHECK(b->sent_count() == 0);
    for (const auto& e : a->sent()) {
        CHECK(e.user_id == "alice");
    }
}

TEST_CASE("EventBridge: concurrent emitters for different users", "[events][bridge][concurrency]") {
    EventBridge bridge;
    constexpr int kUsers = 8;
    constexpr int kEvents = 50;

    std::vector<std::shared_ptr<MockTransport>> transports;
    for (int u = 0; u < kUsers; ++u) {
        transports.push_back(std::make_shared<MockTransport>());
        bridge.attach_connection("user-" + std::to_string(u), transports.back());
    }

    std::vector<std::thread> threads;
    for (int u = 0; u < kUsers; ++u) {
        threads.emplace_back([&bridge, u] {
            const std::string user = "user-" + std::to_string(u);
            for (int i = 0; i < kEvents; ++i) {
                (void)bridge.emit(user, progress_event(user, i));
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int u = 0; u < kUsers; ++u) {
        const auto sent = transports[u]->sent();
        REQUIRE(sent.size() == static_cast<size_t>(kEvents));
        for (int i = 0; i < kEvents; ++i) {
            CHECK(sent[i].user_id == "user-" + std::to_string(u));
            CHECK(sent[i].payload["step"] == i);
        }
    }
    CHECK(bridge.get_stats().delivered == static_cast<uint64_t>(kUsers * kEvents));
}

TEST_CASE("EventBridge: tool notification payload sanitized", "[events][bridge][notify]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("hana", transport);

    (void)bridge.notify_tool_executing("hana", std::string("t-9"), "researcher", "web_search",
                                       {{"query", "weather"}, {"api_token", "secret"}});

    REQUIRE(transport->sent_count() == 1);
    const auto e = transport->sent()[0];
    CHECK(e.type == EventType::TOOL_EXECUTING);
    CHECK(e.thread_id == std::optional<std::string>("t-9"));
    CHECK(e.payload["tool_name"] == "web_search");
    CHECK(e.payload["agent_name"] == "researcher");
    CHECK(e.payload["parameters"]["api_token"] == sanitize::kRedacted);
    CHECK(e.payload["parameters"]["query"] == "weather");
}

TEST_CASE("EventBridge: custom notification keeps non-object data out", "[events][bridge][notify]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("hana", transport);

    (void)bridge.notify_custom("hana", std::nullopt, "planner", "plan_ready", {{"steps", 3}});
    (void)bridge.notify_custom("hana", std::nullopt, "planner", "plan_ready", nlohmann::json::array({1, 2}));

    REQUIRE(transport->sent_count() == 2);
    const auto first = transport->sent()[0];
    CHECK(first.type == EventType::CUSTOM);
    CHECK(first.payload["notification_type"] == "plan_ready");
    CHECK(first.payload["data"]["steps"] == 3);
    CHECK(transport->sent()[1].payload["data"].empty());
}

TEST_CASE("EventBridge: agent death carries recovery action", "[events][bridge][notify]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("ivan", transport);

    (void)bridge.notify_agent_death("ivan", std::nullopt, "triage", "timeout");

    REQUIRE(transport->sent_count() == 1);
    const auto json = transport->sent()[0].to_json();
    CHECK(json["type"] == "agent_death");
    CHECK(json["thread_id"].is_null());
    CHECK(json["payload"]["death_cause"] == "timeout");
    CHECK(json["payload"]["recovery_action"] == "refresh_required");
}

TEST_CASE("EventBridge: degraded error flag propagated", "[events][bridge][notify]") {
    EventBridge bridge;
    auto transport = std::make_shared<MockTransport>();
    bridge.attach_connection("jo", transport);

    (void)bridge.notify_agent_error("jo", std::nullopt, "triage", "Service unavailable",
                                    {{"error_type", "service_unavailable"}, {"degraded", true}});

    REQUIRE(transport->sent_count() == 1);
    const auto payload = transport->sent()[0].payload;
    CHECK(payload["degraded"] == true);
    CHECK(payload["error_context"]["error_type"] == "service_unavailable");
}

TEST_CASE("EventBridge: remove_channel drops pending events", "[events][bridge]") {
    EventBridge bridge;
    (void)bridge.emit("kim", progress_event("kim", 1));
    REQUIRE(bridge.channel_count() == 1);

    CHECK(bridge.remove_channel("kim"));
    CHECK_FALSE(bridge.remove_channel("kim"));
    CHECK(bridge.channel_count() == 0);
    CHECK(bridge.queued_count("kim") == 0);
}

TEST_CASE("EventBridge: transport failing during recovery flush reports without deadlock",
          "[events][bridge][degradation]") {
    auto degradation = std::make_shared<DegradationManager>();
    degradation->register_service("websocket");
    EventBridge bridge(EventBridge::Config{}, degradation);

    auto transport = std::make_shared<SelfReportingTransport>(degradation, "websocket");
    bridge.attach_connection("ana", transport);

    degradation->set_service_status("websocket", false);
    CHECK(bridge.emit("ana", progress_event("ana", 1)) == DeliveryOutcome::QUEUED);
    CHECK(transport->attempts.load() == 0);

    // The flush triggered by recovery hits a send that reports the outage again
    transport->armed = true;
    degradation->set_service_status("websocket", true);

    CHECK(transport->attempts.load() == 1);
    CHECK_FALSE(degradation->is_service_healthy("websocket"));
    CHECK(bridge.queued_count("ana") == 1);
    const auto stats = bridge.channel_stats("ana");
    REQUIRE(stats.has_value());
    CHECK_FALSE(stats->transport_healthy);
}

TEST_CASE("EventBridge: recovery reported from inside a send skips the nested flush",
          "[events][bridge][degradation]") {
    auto degradation = std::make_shared<DegradationManager>();
    degradation->register_service("websocket");
    EventBridge bridge(EventBridge::Config{}, degradation);

    class RecoveringTransport : public IEventTransport {
    public:
        explicit RecoveringTransport(std::shared_ptr<DegradationManager> dm) : dm_(std::move(dm)) {}
        [[nodiscard]] bool send(const Event&, std::chrono::milliseconds) override {
            dm_->set_service_status("websocket", false);
            dm_->set_service_status("websocket", true);
            ++sends;
            return true;
        }
        [[nodiscard]] std::string name() const override { return "recovering"; }
        int sends = 0;
    private:
        std::shared_ptr<DegradationManager> dm_;
    };

    auto transport = std::make_shared<RecoveringTransport>(degradation);
    bridge.attach_connection("ana", transport);
    CHECK(bridge.emit("ana", progress_event("ana", 1)) == DeliveryOutcome::DELIVERED);
    CHECK(transport->sends == 1);
    CHECK(degradation->is_service_healthy("websocket"));
}

TEST_CASE("UserEventEmitter: bound to its user and thread", "[events][emitter]") {
    auto bridge = std::make_shared<EventBridge>();
    auto transport = std::make_shared<MockTransport>();
    bridge->attach_connection("lena", transport);

    UserEventEmitter emitter("lena", std::string("thread-7"), bridge);
    CHECK(emitter.notify_agent_started("planner"));
    CHECK(emitter.notify_agent_thinking("planner", "Considering options", 2, 50.0));
    CHECK(emitter.notify_agent_completed("planner", {{"answer", "42"}}, 12.5));

    const auto sent = transport->sent();
    REQUIRE(sent.size() == 3);
    for (const auto& e : sent) {
        CHECK(e.user_id == "lena");
        CHECK(e.thread_id == std::optional<std::string>("thread-7"));
    }
    CHECK(sent[1].payload["step_number"] == 2);
    CHECK(sent[2].payload["execution_time_ms"] == 12.5);
}

TEST_CASE("UserEventEmitter: inert without a bridge", "[events][emitter]") {
    UserEventEmitter emitter("lena", std::nullopt, nullptr);
    CHECK_FALSE(emitter.has_bridge());
    CHECK_FALSE(emitter.notify_agent_started("planner"));
    CHECK_FALSE(emitter.emit(EventType::CUSTOM, nlohmann::json::object()));
}
