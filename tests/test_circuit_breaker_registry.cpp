#include <catch2/catch_test_macros.hpp>
#include "resilience/circuit_breaker_registry.hpp"
#include "resilience/degradation_manager.hpp"

#include <thread>
#include <vector>

using namespace agentcore;

TEST_CASE("CircuitBreakerRegistry: same dependency returns same breaker", "[circuit_breaker][registry]") {
    CircuitBreakerRegistry registry(CircuitBreaker::Config{});

    auto a = registry.get_breaker("database");
    auto b = registry.get_breaker("database");
    auto c = registry.get_breaker("cache");

    CHECK(a == b);
    CHECK(a != c);
    CHECK(registry.size() == 2);
}

TEST_CASE("CircuitBreakerRegistry: per-dependency config override", "[circuit_breaker][registry]") {
    CircuitBreaker::Config defaults;
    defaults.failure_threshold = 3;
    CircuitBreakerRegistry registry(defaults);

    CircuitBreaker::Config llm;
    llm.failure_threshold = 5;
    llm.call_timeout = std::chrono::milliseconds(30000);
    registry.set_dependency_config("llm", llm);

    CHECK(registry.get_breaker("llm")->config().failure_threshold == 5);
    CHECK(registry.get_breaker("llm")->config().call_timeout == std::chrono::milliseconds(30000));
    CHECK(registry.get_breaker("database")->config().failure_threshold == 3);
}

TEST_CASE("CircuitBreakerRegistry: concurrent get_breaker creates one instance", "[circuit_breaker][registry]") {
    CircuitBreakerRegistry registry(CircuitBreaker::Config{});

    std::vector<std::shared_ptr<CircuitBreaker>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = registry.get_breaker("database"); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        CHECK(r == results[0]);
    }
    CHECK(registry.size() == 1);
}

TEST_CASE("CircuitBreakerRegistry: breaker transitions drive degradation flags", "[circuit_breaker][registry][degradation]") {
    auto degradation = std::make_shared<DegradationManager>();
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 3;
    cfg.open_duration = std::chrono::milliseconds(20);
    CircuitBreakerRegistry registry(cfg, degradation);

    auto db = registry.get_breaker("database");
    CHECK(degradation->is_service_healthy("database"));
    CHECK(degradation->list_services().size() == 1);

    for (int i = 0; i < 3; ++i) db->record_failure();
    CHECK_FALSE(degradation->is_service_healthy("database"));
    CHECK(degradation->level() != DegradationLevel::NORMAL);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    const auto trial = db->allow_request();
    REQUIRE(trial.trial);
    // HALF_OPEN keeps the dependency flagged until the trial succeeds
    CHECK_FALSE(degradation->is_service_healthy("database"));

    db->record_success(trial);
    CHECK(degradation->is_service_healthy("database"));
    CHECK(degradation->level() == DegradationLevel::NORMAL);
}

TEST_CASE("CircuitBreakerRegistry: critical dependency registered as critical", "[circuit_breaker][registry][degradation]") {
    auto degradation = std::make_shared<DegradationManager>();
    CircuitBreakerRegistry registry(CircuitBreaker::Config{}, degradation);

    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    registry.set_dependency_config("auth", cfg, true);
    registry.get_breaker("auth")->record_failure();

    CHECK(degradation->level() == DegradationLevel::DEGRADED);
}

TEST_CASE("CircuitBreakerRegistry: reset_all closes every breaker", "[circuit_breaker][registry]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    CircuitBreakerRegistry registry(cfg);

    registry.get_breaker("a")->record_failure();
    registry.get_breaker("b")->record_failure();
    REQUIRE(registry.get_breaker("a")->get_state() == CircuitState::OPEN);

    registry.reset_all();
    for (const auto& [name, stats] : registry.get_all_stats()) {
        CHECK(stats.state == CircuitState::CLOSED);
    }
    CHECK(registry.get_all_stats().size() == 2);
}
