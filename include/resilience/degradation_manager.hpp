#pragma once

#include "core/types.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace agentcore {

/**
 * @brief Aggregates dependency health into one system degradation level
 *
 * Dependencies are named flags (healthy/unhealthy), usually driven by a
 * CircuitBreaker opening or closing. The level is recomputed from the full
 * flag set on every change, so it never depends on the order in which
 * watchers report:
 *
 *   MINIMAL:  more than majority_fraction unhealthy (with at least
 *             majority_min_services registered), or every member of
 *             minimal_set unhealthy
 *   DEGRADED: more than one unhealthy, or any critical one unhealthy
 *   PARTIAL:  exactly one non-critical unhealthy
 *   NORMAL:   all healthy
 *
 * Rules are evaluated top-down; the first match wins.
 */
class DegradationManager {
public:
    struct Config {
        std::vector<std::string> minimal_set = {"database", "cache", "llm"};
        std::vector<std::string> critical_services;
        double majority_fraction = 0.5;
        size_t majority_min_services = 3;
    };

    struct ServiceHealth {
        std::string name;
        bool healthy = true;
        bool critical = false;
        SystemTime last_change;
    };

    /**
     * Called after a service flag changed; receives the recomputed status.
     * Listeners run on the reporting thread with no manager lock held, so
     * they may report health or add and remove listeners themselves.
     */
    using Listener = std::function<void(const std::string& service, bool healthy,
                                        const DegradationStatus& status)>;

    DegradationManager();
    explicit DegradationManager(Config config);

    /**
     * @brief Declare a dependency (healthy until told otherwise)
     *
     * Re-registering keeps the current health flag and updates criticality.
     */
    void register_service(const std::string& name, bool critical = false);

    /**
     * @brief Set a dependency's health flag (only mutator)
     *
     * Unknown names are registered on the fly. Safe to call concurrently
     * from several dependency watchers.
     */
    void set_service_status(const std::string& name, bool healthy);

    /// Unknown services are reported healthy.
    [[nodiscard]] bool is_service_healthy(const std::string& name) const;

    [[nodiscard]] DegradationStatus get_degradation_status() const;

    [[nodiscard]] DegradationLevel level() const;

    [[nodiscard]] std::vector<ServiceHealth> list_services() const;

    /// @return listener id for remove_listener()
    uint64_t add_listener(Listener listener);

    /**
     * @brief Unregister a listener
     *
     * Blocks until any notification in progress has finished, so the
     * listener's captures may be destroyed afterwards. Called from inside a
     * listener it returns at once; passes already running on other threads
     * may still invoke the removed listener in that case.
     */
    void remove_listener(uint64_t id);

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Pure level computation over a flag set
     */
    [[nodiscard]] static DegradationLevel compute_level(
        const std::map<std::string, ServiceHealth>& services, const Config& config);

private:
    [[nodiscard]] bool is_configured_critical(const std::string& name) const;
    void recompute_locked();
    void notify_listeners(const std::string& name, bool healthy,
                          const DegradationStatus& status);

    Config config_;

    std::map<std::string, ServiceHealth> services_;
    DegradationStatus status_;
    mutable std::shared_mutex mutex_;

    // Notification passes copy the map and run unlocked; notifying_ counts them
    std::map<uint64_t, std::shared_ptr<Listener>> listeners_;
    std::mutex listeners_mutex_;
    std::condition_variable listeners_idle_;
    size_t notifying_ = 0;
    uint64_t next_listener_id_ = 1;
};

} // namespace agentcore
