#include "session/agent_registry.hpp"
#include "resilience/degradation_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace agentcore {

// ============================================================================
// Report rendering
// ============================================================================

nlohmann::json ResetReport::to_json() const {
    return {
        {"user_id", user_id},
        {"status", status},
        {"agents_reset", agents_reset},
        {"errors", errors}
    };
}

nlohmann::json MonitoringReport::to_json() const {
    nlohmann::json users_json = nlohmann::json::object();
    for (const auto& u : users) {
        users_json[u.user_id] = u.to_json();
    }
    return {
        {"timestamp", utils::format_timestamp(timestamp)},
        {"total_users", total_users},
        {"total_agents", total_agents},
        {"status", health_to_string(process_status)},
        {"users", std::move(users_json)},
        {"global_issues", global_issues}
    };
}

nlohmann::json EmergencyCleanupReport::to_json() const {
    return {
        {"timestamp", utils::format_timestamp(timestamp)},
        {"users_cleaned", users_cleaned},
        {"agents_cleaned", agents_cleaned},
        {"errors", errors}
    };
}

nlohmann::json EventWiringReport::to_json() const {
    nlohmann::json details = nlohmann::json::object();
    for (const auto& [user, d] : user_details) {
        details[user] = d;
    }
    return {
        {"registry_has_event_bridge", registry_has_event_bridge},
        {"total_user_sessions", total_sessions},
        {"users_with_event_bridges", users_with_event_bridges},
        {"users_with_live_connection", users_with_live_connection},
        {"critical_issues", critical_issues},
        {"user_details", std::move(details)},
        {"event_health", healthy() ? "HEALTHY" : "CRITICAL"}
    };
}

nlohmann::json RegistryHealth::to_json() const {
    return {
        {"status", health_to_string(status)},
        {"total_user_sessions", total_sessions},
        {"total_user_agents", total_agents},
        {"registered_agent_types", registered_agent_types},
        {"uptime_seconds", uptime.count()},
        {"reclaimed_sessions", reclaimed_sessions},
        {"degradation_level", degradation_level_to_string(degradation_level)},
        {"issues", issues}
    };
}

// ============================================================================
// Construction and session map
// ============================================================================

AgentRegistry::AgentRegistry(Config config,
                             std::shared_ptr<AgentFactoryRegistry> factories,
                             std::shared_ptr<AgentLifecycleManager> lifecycle,
                             std::shared_ptr<DegradationManager> degradation,
                             std::shared_ptr<EventBridge> bridge)
    : config_(config),
      factories_(factories ? std::move(factories) : std::make_shared<AgentFactoryRegistry>()),
      lifecycle_(lifecycle ? std::move(lifecycle) : std::make_shared<AgentLifecycleManager>()),
      degradation_(std::move(degradation)),
      started_at_(std::chrono::steady_clock::now()),
      sessions_(std::make_shared<const SessionMap>()),
      bridge_(std::move(bridge)) {}

std::shared_ptr<const AgentRegistry::SessionMap> AgentRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return sessions_;
}

std::shared_ptr<UserAgentSession> AgentRegistry::get_or_create_session(const std::string& user_id) {
    if (user_id.empty()) {
        throw ContextValidationError("user_id is required");
    }

    // RCU read: lookup without holding the lock
    {
        const auto snap = snapshot();
        const auto it = snap->find(user_id);
        if (it != snap->end()) {
            return it->second;
        }
    }

    std::shared_ptr<UserAgentSession> session;
    {
        std::unique_lock lock(mutex_);
        const auto it = sessions_->find(user_id);
        if (it != sessions_->end()) {
            return it->second;
        }
        session = std::make_shared<UserAgentSession>(user_id, bridge_);
        // Copy-on-write: make mutable copy, insert, swap
        auto new_map = std::make_shared<SessionMap>(*sessions_);
        new_map->emplace(user_id, session);
        sessions_ = std::move(new_map);
    }
    utils::log::info(std::format("Created session for user '{}'", user_id));
    return session;
}

std::shared_ptr<UserAgentSession> AgentRegistry::find_session(const std::string& user_id) const {
    const auto snap = snapshot();
    const auto it = snap->find(user_id);
    return (it != snap->end()) ? it->second : nullptr;
}

std::shared_ptr<UserAgentSession> AgentRegistry::detach_session(const std::string& user_id) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_->find(user_id);
    if (it == sessions_->end()) {
        return nullptr;
    }
    auto session = it->second;
    auto new_map = std::make_shared<SessionMap>(*sessions_);
    new_map->erase(user_id);
    sessions_ = std::move(new_map);
    return session;
}

size_t AgentRegistry::session_count() const {
    return snapshot()->size();
}

std::vector<std::string> AgentRegistry::list_users() const {
    const auto snap = snapshot();
    std::vector<std::string> users;
    users.reserve(snap->size());
    for (const auto& [id, _] : *snap) {
        users.push_back(id);
    }
    std::sort(users.begin(), users.end());
    return users;
}

std::vector<SessionMetrics> AgentRegistry::collect_metrics() const {
    const auto snap = snapshot();
    std::vector<SessionMetrics> metrics;
    metrics.reserve(snap->size());
    for (const auto& [id, session] : *snap) {
        metrics.push_back(session->metrics());
    }
    return metrics;
}

// ============================================================================
// Agents
// ============================================================================

AgentHandle AgentRegistry::create_agent_for_user(const std::string& user_id,
                                                 const std::string& agent_type,
                                                 const ExecutionContext& context) {
    if (user_id.empty() || agent_type.empty()) {
        throw ContextValidationError("user_id and agent_type are required");
    }
    context.validate();
    if (context.user_id != user_id) {
        throw IsolationViolationError(std::format(
            "Execution context for user '{}' used to create agent for user '{}'",
            context.user_id, user_id));
    }

    if (config_.block_creation_when_minimal && degradation_ &&
        degradation_->level() == DegradationLevel::MINIMAL) {
        const std::string message = std::format(
            "Cannot start {} while the system is in minimal mode", agent_type);
        notify_creation_failure(user_id, context, agent_type, message, true);
        throw ServiceUnavailableError(message);
    }

    // Unknown types fail before a session is created for the user
    if (!factories_->contains(agent_type)) {
        const auto existing = find_session(user_id);
        if (!existing || !existing->get_agent(agent_type)) {
            const std::string message = std::format(
                "No factory registered for agent type '{}'", agent_type);
            utils::log::error(std::format("Agent creation failed for user '{}': {}", user_id, message));
            notify_creation_failure(user_id, context, agent_type, message, false);
            throw FactoryError(message);
        }
    }

    for (int attempt = 0; attempt < kMaxSessionAttempts; ++attempt) {
        auto session = get_or_create_session(user_id);
        // Built before taking the session lock (make_emitter locks it too)
        auto emitter = session->make_emitter(context.thread_id);

        bool created = false;
        AgentHandle agent;
        try {
            agent = session->get_or_create(agent_type, [&]() -> AgentHandle {
                if (context.deadline_passed()) {
                    throw FactoryError(std::format(
                        "Deadline passed before creating '{}' for user '{}'", agent_type, user_id));
                }

                AgentContext agent_context{context, agent_type, emitter};
                auto handle = std::make_shared<AgentInstance>(
                    user_id, agent_type, factories_->create(agent_type, agent_context));

                if (context.deadline_passed()) {
                    if (auto err = handle->release()) {
                        utils::log::warn(std::format("Release of late agent '{}' failed: {}",
                                                     agent_type, *err));
                    }
                    throw FactoryError(std::format(
                        "Creation of '{}' for user '{}' exceeded its deadline", agent_type, user_id));
                }
                return handle;
            }, created);
        } catch (const FactoryError& e) {
            utils::log::error(std::format("Agent creation failed for user '{}': {}", user_id, e.what()));
            notify_creation_failure(user_id, context, agent_type, e.what(), false);
            throw;
        }

        if (!agent) {
            // Session closed under us by cleanup/reset; resolve a fresh one
            utils::log::debug(std::format("Session for user '{}' closed during creation, retrying",
                                          user_id));
            continue;
        }

        if (created) {
            utils::log::info(std::format("Created {} agent #{} for user '{}'",
                                         agent_type, agent->id(), user_id));
        }
        return agent;
    }

    throw FactoryError(std::format("Session for user '{}' was closed repeatedly during creation",
                                   user_id));
}

AgentHandle AgentRegistry::get_user_agent(const std::string& user_id,
                                          const std::string& agent_type) const {
    const auto session = find_session(user_id);
    if (!session) {
        return nullptr;
    }
    auto agent = session->get_agent(agent_type);
    if (agent && agent->user_id() != user_id) {
        throw IsolationViolationError(std::format(
            "Session of user '{}' holds an agent created for user '{}'", user_id, agent->user_id()));
    }
    return agent;
}

bool AgentRegistry::remove_user_agent(const std::string& user_id, const std::string& agent_type) {
    const auto session = find_session(user_id);
    if (!session) {
        return false;
    }
    const auto agent = session->take_agent(agent_type);
    if (!agent) {
        return false;
    }
    if (auto err = agent->release()) {
        utils::log::warn(std::format("Error releasing agent '{}' of user '{}': {}",
                                     agent_type, user_id, *err));
    }
    utils::log::debug(std::format("Removed agent '{}' from user '{}'", agent_type, user_id));
    return true;
}

void AgentRegistry::notify_creation_failure(const std::string& user_id,
                                            const ExecutionContext& context,
                                            const std::string& agent_type,
                                            const std::string& message,
                                            bool degraded) const {
    const auto session = find_session(user_id);
    auto bridge = session ? session->event_bridge() : event_bridge();
    if (!bridge) {
        return;
    }
    nlohmann::json error_context = {
        {"error_type", degraded ? "service_unavailable" : "factory_error"},
        {"agent_step", "creation"}
    };
    if (degraded) {
        error_context["degraded"] = true;
    }
    (void)bridge->notify_agent_error(user_id, context.thread_id, agent_type, message, error_context);
}

// ============================================================================
// Cleanup
// ============================================================================

SessionCleanupReport AgentRegistry::cleanup_user_session(const std::string& user_id) {
    const auto session = detach_session(user_id);
    if (!session) {
        SessionCleanupReport report;
        report.user_id = user_id;
        report.status = "no_session";
        return report;
    }

    auto report = session->close();
    drop_event_channel(user_id, *session);
    utils::log::info(std::format("Cleaned up session for user '{}': {} agents, {} errors",
                                 user_id, report.cleaned_agents, report.errors.size()));
    return report;
}

void AgentRegistry::drop_event_channel(const std::string& user_id,
                                       const UserAgentSession& session) const {
    const auto bridge = session.event_bridge();
    if (bridge && bridge->remove_channel(user_id)) {
        utils::log::debug(std::format("Dropped event channel for user '{}'", user_id));
    }
}

ResetReport AgentRegistry::reset_user_agents(const std::string& user_id) {
    if (user_id.empty()) {
        throw ContextValidationError("user_id is required");
    }

    std::shared_ptr<UserAgentSession> old_session;
    {
        std::unique_lock lock(mutex_);
        auto new_map = std::make_shared<SessionMap>(*sessions_);
        auto& slot = (*new_map)[user_id];
        old_session = std::move(slot);
        slot = std::make_shared<UserAgentSession>(user_id, bridge_);
        sessions_ = std::move(new_map);
    }

    ResetReport report;
    report.user_id = user_id;
    if (!old_session) {
        report.status = "no_session";
        return report;
    }

    auto cleanup = old_session->close();
    report.status = "reset_complete";
    report.agents_reset = cleanup.cleaned_agents;
    report.errors = std::move(cleanup.errors);
    utils::log::info(std::format("Reset session for user '{}' ({} agents released)",
                                 user_id, report.agents_reset));
    return report;
}

EmergencyCleanupReport AgentRegistry::emergency_cleanup_all() {
    EmergencyCleanupReport report;
    report.timestamp = utils::now();

    std::shared_ptr<const SessionMap> detached;
    {
        std::unique_lock lock(mutex_);
        detached = std::move(sessions_);
        sessions_ = std::make_shared<const SessionMap>();
    }

    for (const auto& [user_id, session] : *detached) {
        try {
            auto cleanup = session->close();
            drop_event_channel(user_id, *session);
            ++report.users_cleaned;
            report.agents_cleaned += cleanup.cleaned_agents;
            for (const auto& err : cleanup.errors) {
                report.errors.push_back(std::format("User {}: {}", user_id, err));
            }
        } catch (const std::exception& e) {
            report.errors.push_back(std::format("User {}: {}", user_id, e.what()));
        }
    }

    utils::log::warn(std::format("Emergency cleanup completed: {} users, {} agents, {} errors",
                                 report.users_cleaned, report.agents_cleaned, report.errors.size()));
    return report;
}

size_t AgentRegistry::enforce_resource_limits() {
    const auto victims = lifecycle_->select_for_reclaim(collect_metrics());
    size_t reclaimed = 0;
    for (const auto& user_id : victims) {
        const auto report = cleanup_user_session(user_id);
        if (report.status == "cleaned") {
            ++reclaimed;
        }
    }
    lifecycle_->record_reclaimed(reclaimed);
    return reclaimed;
}

size_t AgentRegistry::cleanup_inactive_sessions(std::chrono::milliseconds max_idle) {
    const auto inactive = lifecycle_->select_inactive(collect_metrics(), max_idle);
    size_t removed = 0;
    for (const auto& user_id : inactive) {
        const auto report = cleanup_user_session(user_id);
        if (report.status == "cleaned") {
            ++removed;
        }
    }
    if (removed > 0) {
        utils::log::info(std::format("Removed {} inactive sessions", removed));
    }
    return removed;
}

// ============================================================================
// Monitoring
// ============================================================================

MonitoringReport AgentRegistry::monitor_all_users() const {
    MonitoringReport report;
    report.timestamp = utils::now();

    const auto metrics = collect_metrics();
    for (const auto& m : metrics) {
        auto health = lifecycle_->monitor_memory_usage(m);
        report.total_agents += m.agent_count;
        for (const auto& issue : health.issues) {
            report.global_issues.push_back(std::format("User {}: {}", m.user_id, issue));
        }
        report.users.push_back(std::move(health));
    }
    report.total_users = metrics.size();

    const auto process = lifecycle_->classify_process(metrics);
    report.process_status = process.status;
    report.global_issues.insert(report.global_issues.end(),
                                process.issues.begin(), process.issues.end());
    return report;
}

std::optional<AgentLifecycleManager::UserHealth> AgentRegistry::monitor_user(
    const std::string& user_id) const {
    const auto session = find_session(user_id);
    if (!session) {
        return std::nullopt;
    }
    return lifecycle_->monitor_memory_usage(session->metrics());
}

RegistryHealth AgentRegistry::get_registry_health() const {
    const auto metrics = collect_metrics();
    const auto process = lifecycle_->classify_process(metrics);

    RegistryHealth health;
    health.status = process.status;
    health.total_sessions = process.total_sessions;
    health.total_agents = process.total_agents;
    health.issues = process.issues;
    health.registered_agent_types = factories_->size();
    health.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    health.reclaimed_sessions = lifecycle_->total_reclaimed();

    if (degradation_) {
        health.degradation_level = degradation_->level();
        if (health.degradation_level >= DegradationLevel::DEGRADED) {
            health.issues.push_back(std::format("System degradation level: {}",
                degradation_level_to_string(health.degradation_level)));
            if (health.status == HealthClassification::HEALTHY) {
                health.status = HealthClassification::WARNING;
            }
        }
    }
    return health;
}

// ============================================================================
// Event bridge wiring
// ============================================================================

void AgentRegistry::set_event_bridge(std::shared_ptr<EventBridge> bridge) {
    std::shared_ptr<const SessionMap> snap;
    {
        std::unique_lock lock(mutex_);
        bridge_ = bridge;
        snap = sessions_;
    }
    for (const auto& [user_id, session] : *snap) {
        session->set_event_bridge(bridge);
    }
    utils::log::info(std::format("Event bridge {} for {} existing sessions",
                                 bridge ? "attached" : "detached", snap->size()));
}

std::shared_ptr<EventBridge> AgentRegistry::event_bridge() const {
    std::shared_lock lock(mutex_);
    return bridge_;
}

EventWiringReport AgentRegistry::diagnose_event_wiring() const {
    std::shared_ptr<const SessionMap> snap;
    std::shared_ptr<EventBridge> registry_bridge;
    {
        std::shared_lock lock(mutex_);
        snap = sessions_;
        registry_bridge = bridge_;
    }

    EventWiringReport report;
    report.registry_has_event_bridge = registry_bridge != nullptr;
    report.total_sessions = snap->size();

    for (const auto& [user_id, session] : *snap) {
        const auto session_bridge = session->event_bridge();
        const bool live = session_bridge && session_bridge->has_connection(user_id);
        report.user_details[user_id] = {
            {"has_event_bridge", session_bridge != nullptr},
            {"has_live_connection", live},
            {"agent_count", session->agent_count()}
        };
        if (session_bridge) {
            ++report.users_with_event_bridges;
        } else {
            report.critical_issues.push_back(std::format("User {} has no event bridge", user_id));
        }
        if (live) {
            ++report.users_with_live_connection;
        }
    }

    if (!registry_bridge) {
        report.critical_issues.emplace_back("No event bridge configured on registry");
    }
    if (report.total_sessions > 0) {
        const double coverage = static_cast<double>(report.users_with_event_bridges) /
                                static_cast<double>(report.total_sessions);
        if (coverage < 0.8) {
            report.critical_issues.push_back(std::format("Low user bridge coverage: {:.1f}%",
                                                         coverage * 100.0));
        }
    }
    return report;
}

} // namespace agentcore
