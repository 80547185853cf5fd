#include "session/lifecycle_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace agentcore {

nlohmann::json AgentLifecycleManager::UserHealth::to_json() const {
    return {
        {"user_id", user_id},
        {"status", health_to_string(status)},
        {"issues", issues},
        {"agent_count", agent_count},
        {"estimated_bytes", estimated_bytes},
        {"metrics", metrics.to_json()}
    };
}

nlohmann::json AgentLifecycleManager::ProcessHealth::to_json() const {
    return {
        {"status", health_to_string(status)},
        {"total_sessions", total_sessions},
        {"total_agents", total_agents},
        {"estimated_bytes", estimated_bytes},
        {"issues", issues}
    };
}

AgentLifecycleManager::AgentLifecycleManager()
    : AgentLifecycleManager(Config{}) {}

AgentLifecycleManager::AgentLifecycleManager(Config config)
    : config_(std::move(config)) {}

AgentLifecycleManager::UserHealth AgentLifecycleManager::monitor_memory_usage(
    const SessionMetrics& metrics) const {
    UserHealth health;
    health.user_id = metrics.user_id;
    health.agent_count = metrics.agent_count;
    health.estimated_bytes = metrics.agent_count * config_.estimated_bytes_per_agent;
    health.metrics = metrics;

    if (metrics.agent_count > config_.max_agents_per_user) {
        health.status = HealthClassification::CRITICAL;
        health.issues.push_back(std::format("Too many agents: {} > {}",
                                            metrics.agent_count, config_.max_agents_per_user));
    } else if (metrics.agent_count >= config_.warning_agents_per_user) {
        health.status = HealthClassification::WARNING;
        health.issues.push_back(std::format("High agent count: {}", metrics.agent_count));
    }

    if (metrics.age > config_.max_session_age) {
        if (health.status == HealthClassification::HEALTHY) {
            health.status = HealthClassification::WARNING;
        }
        health.issues.push_back(std::format("Session too old: {:.1f}h",
            std::chrono::duration<double, std::ratio<3600>>(metrics.age).count()));
    }
    return health;
}

AgentLifecycleManager::ProcessHealth AgentLifecycleManager::classify_process(
    const std::vector<SessionMetrics>& sessions) const {
    ProcessHealth health;
    health.total_sessions = sessions.size();
    for (const auto& m : sessions) {
        health.total_agents += m.agent_count;
    }
    health.estimated_bytes = health.total_agents * config_.estimated_bytes_per_agent;

    const bool too_many_sessions = health.total_sessions > config_.max_sessions;
    const bool too_many_agents = health.total_agents > config_.max_total_agents;

    if (too_many_sessions) {
        health.issues.push_back(std::format("High user session count: {} > {}",
                                            health.total_sessions, config_.max_sessions));
    }
    if (too_many_agents) {
        health.issues.push_back(std::format("Excessive user agent count: {} > {}",
                                            health.total_agents, config_.max_total_agents));
    }

    if (too_many_sessions || too_many_agents) {
        health.status = HealthClassification::CRITICAL;
        return health;
    }

    const double session_load = config_.max_sessions == 0 ? 0.0
        : static_cast<double>(health.total_sessions) / static_cast<double>(config_.max_sessions);
    const double agent_load = config_.max_total_agents == 0 ? 0.0
        : static_cast<double>(health.total_agents) / static_cast<double>(config_.max_total_agents);
    if (session_load >= config_.warning_fraction || agent_load >= config_.warning_fraction) {
        health.status = HealthClassification::WARNING;
        health.issues.push_back(std::format("Approaching capacity: {} sessions, {} agents",
                                            health.total_sessions, health.total_agents));
    }
    return health;
}

std::vector<std::string> AgentLifecycleManager::select_for_reclaim(
    std::vector<SessionMetrics> sessions) const {
    size_t session_count = sessions.size();
    size_t agent_total = 0;
    for (const auto& m : sessions) {
        agent_total += m.agent_count;
    }
    if (session_count <= config_.max_sessions && agent_total <= config_.max_total_agents) {
        return {};
    }

    // Least recently active first (largest idle)
    std::sort(sessions.begin(), sessions.end(), [](const SessionMetrics& a, const SessionMetrics& b) {
        return a.idle > b.idle;
    });

    std::vector<std::string> victims;
    for (const auto& m : sessions) {
        if (session_count <= config_.max_sessions && agent_total <= config_.max_total_agents) {
            break;
        }
        victims.push_back(m.user_id);
        --session_count;
        agent_total -= m.agent_count;
    }
    return victims;
}

std::vector<std::string> AgentLifecycleManager::select_inactive(
    std::vector<SessionMetrics> sessions, std::chrono::milliseconds max_idle) const {
    std::sort(sessions.begin(), sessions.end(), [](const SessionMetrics& a, const SessionMetrics& b) {
        return a.idle > b.idle;
    });
    std::vector<std::string> inactive;
    for (const auto& m : sessions) {
        if (m.idle <= max_idle) break;
        inactive.push_back(m.user_id);
    }
    return inactive;
}

void AgentLifecycleManager::record_reclaimed(size_t count) {
    if (count == 0) return;
    const uint64_t total = reclaimed_.fetch_add(count, std::memory_order_relaxed) + count;
    utils::log::warn(std::format("Reclaimed {} sessions ({} total)", count, total));
}

} // namespace agentcore
