#include "runtime/agent_runtime.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace agentcore {

nlohmann::json MonitoringCycleReport::to_json() const {
    nlohmann::json affected = nlohmann::json::array();
    for (const auto& s : degradation.affected_services) {
        affected.push_back(s);
    }
    return {
        {"monitoring", monitoring.to_json()},
        {"reclaimed_sessions", reclaimed_sessions},
        {"idle_sessions_removed", idle_sessions_removed},
        {"degradation", {
            {"level", degradation_level_to_string(degradation.level)},
            {"affected_services", std::move(affected)}
        }}
    };
}

nlohmann::json RuntimeShutdownReport::to_json() const {
    return {
        {"drained", drained},
        {"in_flight_at_shutdown", in_flight_at_shutdown},
        {"events_flushed", events_flushed},
        {"cleanup", cleanup.to_json()}
    };
}

AgentRuntime::AgentRuntime(CoreConfig config)
    : config_(std::move(config)),
      factories_(std::make_shared<AgentFactoryRegistry>()) {}

AgentRuntime::~AgentRuntime() {
    (void)shutdown();
}

void AgentRuntime::init() {
    std::lock_guard lock(lifecycle_mutex_);
    {
        std::lock_guard gate(gate_mutex_);
        if (phase_ != Phase::CREATED) {
            throw std::logic_error("AgentRuntime::init called twice");
        }
    }

    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    }

    // 1. Resilience layer
    degradation_ = std::make_shared<DegradationManager>(config_.degradation);
    breakers_ = std::make_shared<CircuitBreakerRegistry>(config_.circuit_breaker.defaults, degradation_);
    for (const auto& dep : config_.circuit_breaker.dependencies) {
        breakers_->set_dependency_config(dep.name, dep.config, dep.critical);
        (void)breakers_->get_breaker(dep.name);
    }
    utils::log::info(std::format("Resilience layer ready: {} dependencies", breakers_->size()));

    // 2. Event bridge
    bridge_ = std::make_shared<EventBridge>(config_.event_bridge, degradation_);

    // 3. Sessions
    lifecycle_ = std::make_shared<AgentLifecycleManager>(config_.lifecycle);
    registry_ = std::make_shared<AgentRegistry>(config_.registry.registry, factories_, lifecycle_,
                                                degradation_, bridge_);

    {
        std::lock_guard gate(gate_mutex_);
        phase_ = Phase::RUNNING;
    }
    utils::log::info(std::format("Agent runtime initialized ({} agent types registered)",
                                 factories_->size()));
}

bool AgentRuntime::is_running() const {
    std::lock_guard lock(gate_mutex_);
    return phase_ == Phase::RUNNING;
}

uint32_t AgentRuntime::active_operations() const {
    std::lock_guard lock(gate_mutex_);
    return active_operations_;
}

// ============================================================================
// Admission
// ============================================================================

bool AgentRuntime::begin_operation(std::string_view operation) {
    std::lock_guard lock(gate_mutex_);
    if (phase_ != Phase::RUNNING) {
        utils::log::debug(std::format("Refused {}: runtime {}", operation,
                                      phase_ == Phase::CREATED ? "not started" : "shutting down"));
        return false;
    }
    ++active_operations_;
    return true;
}

void AgentRuntime::end_operation() {
    bool last = false;
    {
        std::lock_guard lock(gate_mutex_);
        last = (--active_operations_ == 0);
    }
    if (last) {
        drained_.notify_all();
    }
}

void AgentRuntime::require_operation(std::string_view operation) {
    if (begin_operation(operation)) {
        return;
    }
    std::lock_guard lock(gate_mutex_);
    if (phase_ == Phase::CREATED) {
        throw ServiceUnavailableError("Agent runtime is not running");
    }
    throw ServiceUnavailableError(std::format("Agent runtime is shutting down, {} refused", operation));
}

// ============================================================================
// Agent operations
// ============================================================================

AgentHandle AgentRuntime::create_agent(const std::string& user_id,
                                       const std::string& agent_type,
                                       const ExecutionContext& context) {
    require_operation("agent creation");
    ActiveOperation active(*this);
    return registry_->create_agent_for_user(user_id, agent_type, context);
}

ResetReport AgentRuntime::reset_user(const std::string& user_id) {
    require_operation("session reset");
    ActiveOperation active(*this);
    return registry_->reset_user_agents(user_id);
}

SessionCleanupReport AgentRuntime::cleanup_user(const std::string& user_id) {
    require_operation("session cleanup");
    ActiveOperation active(*this);
    return registry_->cleanup_user_session(user_id);
}

MonitoringCycleReport AgentRuntime::run_monitoring_cycle() {
    MonitoringCycleReport report;
    if (!begin_operation("monitoring cycle")) {
        return report;
    }
    ActiveOperation active(*this);

    if (config_.registry.enforce_limits_on_monitor) {
        report.reclaimed_sessions = registry_->enforce_resource_limits();
    }
    if (config_.registry.cleanup_idle_on_monitor) {
        report.idle_sessions_removed = registry_->cleanup_inactive_sessions(
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.lifecycle.max_idle));
    }
    report.monitoring = registry_->monitor_all_users();
    report.degradation = degradation_->get_degradation_status();

    if (!report.monitoring.global_issues.empty()) {
        utils::log::warn(std::format("Monitoring: {} users, {} agents, {} issues",
                                     report.monitoring.total_users, report.monitoring.total_agents,
                                     report.monitoring.global_issues.size()));
    }
    return report;
}

// ============================================================================
// Shutdown
// ============================================================================

RuntimeShutdownReport AgentRuntime::shutdown() {
    std::lock_guard lock(lifecycle_mutex_);
    RuntimeShutdownReport report;
    {
        std::unique_lock gate(gate_mutex_);
        if (phase_ != Phase::RUNNING) {
            return report;
        }
        phase_ = Phase::DRAINING;
        report.in_flight_at_shutdown = active_operations_;
        utils::log::info(std::format("Shutting down agent runtime, draining {} operations",
                                     active_operations_));

        report.drained = drained_.wait_for(gate, config_.shutdown.drain_timeout,
                                           [this] { return active_operations_ == 0; });
        if (!report.drained) {
            utils::log::warn(std::format("Drain timed out after {}ms with {} operations in flight",
                                         config_.shutdown.drain_timeout.count(), active_operations_));
        }
    }

    // Last chance for connected users to receive queued events
    report.events_flushed = bridge_->flush_all();
    report.cleanup = registry_->emergency_cleanup_all();

    {
        std::lock_guard gate(gate_mutex_);
        phase_ = Phase::STOPPED;
    }
    utils::log::info(std::format("Agent runtime stopped: {} users, {} agents cleaned",
                                 report.cleanup.users_cleaned, report.cleanup.agents_cleaned));
    return report;
}

} // namespace agentcore
