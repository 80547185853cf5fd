#include "resilience/circuit_breaker_registry.hpp"
#include "resilience/degradation_manager.hpp"
#include "core/utils.hpp"

#include <format>

namespace agentcore {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreaker::Config& default_config,
                                               std::shared_ptr<DegradationManager> degradation)
    : default_config_(default_config),
      degradation_(std::move(degradation)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_breaker(const std::string& dependency) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(breakers_mutex_);
        const auto it = breakers_.find(dependency);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    // Resolve config BEFORE taking breakers_mutex_ unique lock
    CircuitBreaker::Config cfg = default_config_;
    bool critical = false;
    {
        std::shared_lock cfg_lock(config_mutex_);
        const auto cfg_it = overrides_.find(dependency);
        if (cfg_it != overrides_.end()) {
            cfg = cfg_it->second.config;
            critical = cfg_it->second.critical;
        }
    }

    // Wire the candidate before it becomes visible to other threads
    auto candidate = std::make_shared<CircuitBreaker>(dependency, cfg);
    if (degradation_) {
        degradation_->register_service(dependency, critical);
        std::weak_ptr<DegradationManager> weak = degradation_;
        candidate->set_on_state_change([weak](const StateChangeEvent& e) {
            const auto manager = weak.lock();
            if (!manager) return;
            if (e.to == CircuitState::OPEN) {
                manager->set_service_status(e.breaker_name, false);
            } else if (e.to == CircuitState::CLOSED) {
                manager->set_service_status(e.breaker_name, true);
            }
        });
    }

    // Slow path: unique lock + try_emplace
    {
        std::unique_lock lock(breakers_mutex_);
        auto [it, inserted] = breakers_.try_emplace(dependency, candidate);
        if (!inserted) {
            return it->second;
        }
    }

    utils::log::info(std::format("Circuit breaker created for '{}' (threshold={}, open={}ms, timeout={}ms)",
                                 dependency, cfg.failure_threshold,
                                 cfg.open_duration.count(), cfg.call_timeout.count()));
    return candidate;
}

void CircuitBreakerRegistry::set_dependency_config(
    const std::string& dependency, const CircuitBreaker::Config& config, bool critical) {
    {
        std::unique_lock lock(config_mutex_);
        overrides_[dependency] = DependencyOverride{config, critical};
    }
    if (degradation_) {
        degradation_->register_service(dependency, critical);
    }
}

std::vector<std::pair<std::string, CircuitBreakerStats>>
CircuitBreakerRegistry::get_all_stats() const {
    std::shared_lock lock(breakers_mutex_);
    std::vector<std::pair<std::string, CircuitBreakerStats>> result;
    result.reserve(breakers_.size());
    for (const auto& [key, breaker] : breakers_) {
        result.emplace_back(key, breaker->get_stats());
    }
    return result;
}

void CircuitBreakerRegistry::reset_all() {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::shared_lock lock(breakers_mutex_);
        snapshot.reserve(breakers_.size());
        for (const auto& [key, breaker] : breakers_) {
            snapshot.push_back(breaker);
        }
    }
    for (const auto& breaker : snapshot) {
        breaker->reset();
    }
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

} // namespace agentcore
