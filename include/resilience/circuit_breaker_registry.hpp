#pragma once

#include "resilience/circuit_breaker.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentcore {

class DegradationManager;

/**
 * @brief Registry of per-dependency circuit breakers.
 *
 * Lazily creates circuit breakers on first access using double-checked locking
 * with a shared_mutex for read-heavy workloads (lookups dominate creates).
 *
 * When a DegradationManager is attached, each new breaker registers its
 * dependency there and reports OPEN as unhealthy, CLOSED as healthy.
 * HALF_OPEN leaves the flag unhealthy until the trial succeeds.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const CircuitBreaker::Config& default_config,
                                    std::shared_ptr<DegradationManager> degradation = nullptr);

    /**
     * @brief Get or create circuit breaker for a dependency.
     *
     * Uses double-checked locking: shared_lock for fast path (existing),
     * unique_lock + try_emplace for slow path (creation).
     *
     * @param dependency Dependency name (e.g., "database")
     * @return Shared pointer to the breaker (never null)
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& dependency);

    /**
     * @brief Set per-dependency config override.
     * Affects subsequently created breakers for this dependency.
     */
    void set_dependency_config(const std::string& dependency, const CircuitBreaker::Config& config,
                               bool critical = false);

    /**
     * @brief Get stats for all breakers in the registry.
     * @return Vector of (dependency, stats) pairs.
     */
    [[nodiscard]] std::vector<std::pair<std::string, CircuitBreakerStats>> get_all_stats() const;

    /**
     * @brief Force every breaker back to CLOSED.
     */
    void reset_all();

    /**
     * @brief Get number of breakers in the registry.
     */
    [[nodiscard]] size_t size() const;

private:
    struct DependencyOverride {
        CircuitBreaker::Config config;
        bool critical = false;
    };

    CircuitBreaker::Config default_config_;
    std::shared_ptr<DegradationManager> degradation_;

    // Breaker storage (double-checked locking pattern)
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;

    // Per-dependency config overrides
    std::unordered_map<std::string, DependencyOverride> overrides_;
    mutable std::shared_mutex config_mutex_;
};

} // namespace agentcore
