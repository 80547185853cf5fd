#include <catch2/catch_test_macros.hpp>
#include "resilience/degradation_manager.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace agentcore;

namespace {

std::shared_ptr<DegradationManager> make_manager(std::vector<std::string> services) {
    auto dm = std::make_shared<DegradationManager>();
    for (const auto& s : services) {
        dm->register_service(s);
    }
    return dm;
}

} // anonymous namespace

TEST_CASE("DegradationManager: NORMAL with every dependency healthy", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});
    CHECK(dm->level() == DegradationLevel::NORMAL);
    CHECK(dm->get_degradation_status().affected_services.empty());
}

TEST_CASE("DegradationManager: one non-critical down is PARTIAL", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});
    dm->set_service_status("cache", false);

    const auto status = dm->get_degradation_status();
    CHECK(status.level == DegradationLevel::PARTIAL);
    CHECK(status.affected_services == std::set<std::string>{"cache"});
    CHECK_FALSE(dm->is_service_healthy("cache"));
}

TEST_CASE("DegradationManager: two down is DEGRADED", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket", "search"});
    dm->set_service_status("database", false);
    dm->set_service_status("cache", false);
    CHECK(dm->level() == DegradationLevel::DEGRADED);
}

TEST_CASE("DegradationManager: critical dependency down is DEGRADED", "[degradation]") {
    DegradationManager::Config cfg;
    cfg.critical_services = {"database"};
    DegradationManager dm(cfg);
    dm.register_service("database");
    dm.register_service("cache");
    dm.register_service("llm");
    dm.register_service("websocket");

    dm.set_service_status("database", false);
    CHECK(dm.level() == DegradationLevel::DEGRADED);
}

TEST_CASE("DegradationManager: majority down is MINIMAL", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});
    dm->set_service_status("database", false);
    dm->set_service_status("websocket", false);
    // Exactly half is not a majority
    CHECK(dm->level() == DegradationLevel::DEGRADED);

    dm->set_service_status("llm", false);
    CHECK(dm->level() == DegradationLevel::MINIMAL);
}

TEST_CASE("DegradationManager: whole core set down is MINIMAL", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket", "search", "metrics", "mail"});
    dm->set_service_status("database", false);
    dm->set_service_status("cache", false);
    CHECK(dm->level() == DegradationLevel::DEGRADED);

    dm->set_service_status("llm", false);
    CHECK(dm->level() == DegradationLevel::MINIMAL);
}

TEST_CASE("DegradationManager: majority rule needs minimum service count", "[degradation]") {
    auto dm = make_manager({"database", "websocket"});
    dm->set_service_status("websocket", false);
    CHECK(dm->level() == DegradationLevel::PARTIAL);
}

TEST_CASE("DegradationManager: all restored returns to NORMAL", "[degradation]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});
    dm->set_service_status("database", false);
    dm->set_service_status("cache", false);
    dm->set_service_status("llm", false);
    REQUIRE(dm->level() == DegradationLevel::MINIMAL);

    dm->set_service_status("llm", true);
    dm->set_service_status("cache", true);
    dm->set_service_status("database", true);
    CHECK(dm->level() == DegradationLevel::NORMAL);
    CHECK(dm->get_degradation_status().affected_services.empty());
}

TEST_CASE("DegradationManager: level independent of report order", "[degradation]") {
    auto a = make_manager({"database", "cache", "llm", "websocket", "search"});
    auto b = make_manager({"database", "cache", "llm", "websocket", "search"});

    a->set_service_status("cache", false);
    a->set_service_status("search", false);
    a->set_service_status("cache", true);

    b->set_service_status("search", false);

    CHECK(a->level() == b->level());
    CHECK(a->level() == DegradationLevel::PARTIAL);
}

TEST_CASE("DegradationManager: unknown service registered on first report", "[degradation]") {
    DegradationManager dm;
    CHECK(dm.is_service_healthy("never-seen"));

    dm.set_service_status("search", false);
    CHECK(dm.list_services().size() == 1);
    CHECK(dm.level() == DegradationLevel::PARTIAL);
}

TEST_CASE("DegradationManager: listeners see each change", "[degradation][listener]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});

    std::vector<std::pair<std::string, bool>> seen;
    DegradationLevel last_level = DegradationLevel::NORMAL;
    const auto id = dm->add_listener([&](const std::string& service, bool healthy,
                                         const DegradationStatus& status) {
        seen.emplace_back(service, healthy);
        last_level = status.level;
    });

    dm->set_service_status("cache", false);
    // Repeating the same flag is not a change
    dm->set_service_status("cache", false);
    dm->set_service_status("cache", true);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == std::make_pair(std::string("cache"), false));
    CHECK(seen[1] == std::make_pair(std::string("cache"), true));
    CHECK(last_level == DegradationLevel::NORMAL);

    dm->remove_listener(id);
    dm->set_service_status("llm", false);
    CHECK(seen.size() == 2);
}

TEST_CASE("DegradationManager: listener may report health and unregister itself", "[degradation][listener]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket"});

    int calls = 0;
    uint64_t id = 0;
    id = dm->add_listener([&](const std::string& service, bool healthy, const DegradationStatus&) {
        ++calls;
        if (service == "websocket" && !healthy) {
            // Cascading report from inside a notification
            dm->set_service_status("cache", false);
            dm->remove_listener(id);
        }
    });

    dm->set_service_status("websocket", false);
    CHECK(calls == 2);
    CHECK_FALSE(dm->is_service_healthy("cache"));
    CHECK(dm->level() == DegradationLevel::DEGRADED);

    dm->set_service_status("cache", true);
    CHECK(calls == 2);
}

TEST_CASE("DegradationManager: remove_listener waits for a running notification", "[degradation][listener]") {
    auto dm = make_manager({"database", "cache", "llm"});

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<bool> finished{false};
    std::atomic<bool> finished_before_removed{false};
    const auto id = dm->add_listener([&](const std::string&, bool, const DegradationStatus&) {
        entered = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        finished = true;
    });

    std::thread reporter([&] { dm->set_service_status("cache", false); });
    while (!entered.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::thread remover([&] {
        dm->remove_listener(id);
        finished_before_removed = finished.load();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    // Listener map and status stay usable while the listener blocks
    CHECK(dm->add_listener([](const std::string&, bool, const DegradationStatus&) {}) != id);
    CHECK_FALSE(dm->is_service_healthy("cache"));

    release = true;
    reporter.join();
    remover.join();
    CHECK(finished_before_removed.load());
}

TEST_CASE("DegradationManager: concurrent watchers converge", "[degradation][concurrency]") {
    auto dm = make_manager({"database", "cache", "llm", "websocket", "search", "mail"});
    const std::vector<std::string> names = {"database", "cache", "llm", "websocket", "search", "mail"};

    std::vector<std::thread> threads;
    for (const auto& name : names) {
        threads.emplace_back([&dm, name] {
            for (int i = 0; i < 100; ++i) {
                dm->set_service_status(name, i % 2 == 0);
            }
        });
    }
    for (auto& t : threads) t.join();

    // Last write of each watcher was healthy=false (i == 99)
    CHECK(dm->get_degradation_status().affected_services.size() == names.size());
    CHECK(dm->level() == DegradationLevel::MINIMAL);
}

TEST_CASE("DegradationManager: compute_level is pure", "[degradation]") {
    std::map<std::string, DegradationManager::ServiceHealth> services;
    services["cache"] = {"cache", false, false, {}};
    services["database"] = {"database", true, false, {}};
    services["llm"] = {"llm", true, false, {}};

    CHECK(DegradationManager::compute_level(services, DegradationManager::Config{}) ==
          DegradationLevel::PARTIAL);

    services["cache"].critical = true;
    CHECK(DegradationManager::compute_level(services, DegradationManager::Config{}) ==
          DegradationLevel::DEGRADED);
}

TEST_CASE("DegradationManager: three core dependencies", "[degradation]") {
    auto dm = make_manager({"db", "cache", "llm"});

    dm->set_service_status("cache", false);
    CHECK(dm->level() == DegradationLevel::PARTIAL);

    dm->set_service_status("db", false);
    // Two of three is a strict majority
    CHECK(dm->level() == DegradationLevel::MINIMAL);

    dm->set_service_status("db", true);
    dm->set_service_status("cache", true);
    CHECK(dm->level() == DegradationLevel::NORMAL);
}
