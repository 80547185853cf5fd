#include "resilience/degradation_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace agentcore {

namespace {

// Notification passes running on this thread
thread_local int t_notify_depth = 0;

} // anonymous namespace

DegradationManager::DegradationManager()
    : DegradationManager(Config{}) {}

DegradationManager::DegradationManager(Config config)
    : config_(std::move(config)) {
    status_.last_recomputed = utils::now();
}

bool DegradationManager::is_configured_critical(const std::string& name) const {
    return std::find(config_.critical_services.begin(), config_.critical_services.end(), name)
           != config_.critical_services.end();
}

void DegradationManager::register_service(const std::string& name, bool critical) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = services_.try_emplace(name);
    if (inserted) {
        it->second.name = name;
        it->second.last_change = utils::now();
    }
    it->second.critical = critical || is_configured_critical(name);
    recompute_locked();
}

void DegradationManager::set_service_status(const std::string& name, bool healthy) {
    DegradationStatus snapshot;
    DegradationLevel previous_level;
    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = services_.try_emplace(name);
        if (inserted) {
            it->second.name = name;
            it->second.critical = is_configured_critical(name);
        } else if (it->second.healthy == healthy) {
            return;
        }
        it->second.healthy = healthy;
        it->second.last_change = utils::now();

        previous_level = status_.level;
        recompute_locked();
        snapshot = status_;
    }

    if (snapshot.level != previous_level) {
        const auto msg = std::format("Degradation level {} -> {} ({} unhealthy)",
                                     degradation_level_to_string(previous_level),
                                     degradation_level_to_string(snapshot.level),
                                     snapshot.affected_services.size());
        if (snapshot.level > previous_level) {
            utils::log::warn(msg);
        } else {
            utils::log::info(msg);
        }
    }

    notify_listeners(name, healthy, snapshot);
}

void DegradationManager::notify_listeners(const std::string& name, bool healthy,
                                          const DegradationStatus& status) {
    std::vector<std::shared_ptr<Listener>> targets;
    {
        std::lock_guard lock(listeners_mutex_);
        if (listeners_.empty()) return;
        targets.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            targets.push_back(listener);
        }
        ++notifying_;
    }

    auto finish = [this] {
        --t_notify_depth;
        {
            std::lock_guard lock(listeners_mutex_);
            --notifying_;
        }
        listeners_idle_.notify_all();
    };

    ++t_notify_depth;
    try {
        for (const auto& listener : targets) {
            (*listener)(name, healthy, status);
        }
    } catch (...) {
        finish();
        throw;
    }
    finish();
}

bool DegradationManager::is_service_healthy(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = services_.find(name);
    return it == services_.end() || it->second.healthy;
}

DegradationStatus DegradationManager::get_degradation_status() const {
    std::shared_lock lock(mutex_);
    return status_;
}

DegradationLevel DegradationManager::level() const {
    std::shared_lock lock(mutex_);
    return status_.level;
}

std::vector<DegradationManager::ServiceHealth> DegradationManager::list_services() const {
    std::shared_lock lock(mutex_);
    std::vector<ServiceHealth> result;
    result.reserve(services_.size());
    for (const auto& [name, health] : services_) {
        result.push_back(health);
    }
    return result;
}

uint64_t DegradationManager::add_listener(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    const uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::make_shared<Listener>(std::move(listener)));
    return id;
}

void DegradationManager::remove_listener(uint64_t id) {
    std::unique_lock lock(listeners_mutex_);
    listeners_.erase(id);
    if (t_notify_depth > 0) {
        // Waiting here would wait on ourselves
        return;
    }
    listeners_idle_.wait(lock, [this] { return notifying_ == 0; });
}

DegradationLevel DegradationManager::compute_level(
    const std::map<std::string, ServiceHealth>& services, const Config& config) {

    size_t unhealthy = 0;
    bool critical_down = false;
    for (const auto& [name, health] : services) {
        if (!health.healthy) {
            ++unhealthy;
            critical_down = critical_down || health.critical;
        }
    }

    if (unhealthy == 0) {
        return DegradationLevel::NORMAL;
    }

    // Majority rule
    const size_t total = services.size();
    if (total >= config.majority_min_services &&
        static_cast<double>(unhealthy) > static_cast<double>(total) * config.majority_fraction) {
        return DegradationLevel::MINIMAL;
    }

    // Whole core set down
    if (!config.minimal_set.empty()) {
        const bool all_core_down = std::all_of(
            config.minimal_set.begin(), config.minimal_set.end(),
            [&services](const std::string& name) {
                const auto it = services.find(name);
                return it != services.end() && !it->second.healthy;
            });
        if (all_core_down) {
            return DegradationLevel::MINIMAL;
        }
    }

    if (unhealthy > 1 || critical_down) {
        return DegradationLevel::DEGRADED;
    }
    return DegradationLevel::PARTIAL;
}

void DegradationManager::recompute_locked() {
    status_.level = compute_level(services_, config_);
    status_.affected_services.clear();
    for (const auto& [name, health] : services_) {
        if (!health.healthy) {
            status_.affected_services.insert(name);
        }
    }
    status_.last_recomputed = utils::now();
}

} // namespace agentcore
