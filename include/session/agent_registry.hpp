#pragma once

#include "core/types.hpp"
#include "events/event_bridge.hpp"
#include "session/agent.hpp"
#include "session/agent_factory_registry.hpp"
#include "session/execution_context.hpp"
#include "session/lifecycle_manager.hpp"
#include "session/user_agent_session.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcore {

class DegradationManager;

// ============================================================================
// Reports (plain data for dashboards, rendered with to_json)
// ============================================================================

struct ResetReport {
    std::string user_id;
    std::string status;         // "reset_complete" or "no_session"
    size_t agents_reset = 0;
    std::vector<std::string> errors;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct MonitoringReport {
    SystemTime timestamp;
    size_t total_users = 0;
    size_t total_agents = 0;
    std::vector<AgentLifecycleManager::UserHealth> users;
    std::vector<std::string> global_issues;
    HealthClassification process_status = HealthClassification::HEALTHY;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct EmergencyCleanupReport {
    SystemTime timestamp;
    size_t users_cleaned = 0;
    size_t agents_cleaned = 0;
    std::vector<std::string> errors;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct EventWiringReport {
    bool registry_has_event_bridge = false;
    size_t total_sessions = 0;
    size_t users_with_event_bridges = 0;
    size_t users_with_live_connection = 0;
    std::vector<std::string> critical_issues;
    std::map<std::string, nlohmann::json> user_details;

    [[nodiscard]] bool healthy() const { return critical_issues.empty(); }
    [[nodiscard]] nlohmann::json to_json() const;
};

struct RegistryHealth {
    HealthClassification status = HealthClassification::HEALTHY;
    size_t total_sessions = 0;
    size_t total_agents = 0;
    size_t registered_agent_types = 0;
    std::chrono::seconds uptime{0};
    uint64_t reclaimed_sessions = 0;
    DegradationLevel degradation_level = DegradationLevel::NORMAL;
    std::vector<std::string> issues;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Top-level façade: user id -> UserAgentSession
 *
 * The session map is copy-on-write: readers take a snapshot under a shared
 * lock and search it unlocked; writers copy, modify and swap under the
 * unique lock, which is held only for insert/erase. All per-user work then
 * happens under that session's own lock, so unrelated users never block
 * each other.
 *
 * Isolation rules:
 * - context.user_id must match the target user (IsolationViolationError)
 * - an agent is created, stored and looked up only through its own
 *   user's session
 * - agents receive an emitter bound to their user, never the bridge
 */
class AgentRegistry {
public:
    struct Config {
        // Refuse agent creation while degradation is MINIMAL
        bool block_creation_when_minimal = true;
    };

    AgentRegistry(Config config,
                  std::shared_ptr<AgentFactoryRegistry> factories,
                  std::shared_ptr<AgentLifecycleManager> lifecycle,
                  std::shared_ptr<DegradationManager> degradation = nullptr,
                  std::shared_ptr<EventBridge> bridge = nullptr);

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    /**
     * @brief Existing session for user_id, or a new empty one
     * @throws ContextValidationError if user_id is empty
     */
    [[nodiscard]] std::shared_ptr<UserAgentSession> get_or_create_session(const std::string& user_id);

    /// Lookup only; nullptr if the user has no session.
    [[nodiscard]] std::shared_ptr<UserAgentSession> find_session(const std::string& user_id) const;

    /**
     * @brief Create (or return the existing) agent of agent_type for user_id
     *
     * Validation happens before any mutation. The factory runs under the
     * user's session lock. An agent of the same type already in the session
     * is returned unchanged; replacing it requires remove or reset first.
     *
     * @throws ContextValidationError missing user_id/run_id/agent_type
     * @throws IsolationViolationError context.user_id != user_id
     * @throws ServiceUnavailableError degradation MINIMAL and blocking enabled
     * @throws FactoryError unregistered type, factory failure, deadline passed
     */
    [[nodiscard]] AgentHandle create_agent_for_user(const std::string& user_id,
                                                    const std::string& agent_type,
                                                    const ExecutionContext& context);

    /// Pure lookup, no side effects.
    [[nodiscard]] AgentHandle get_user_agent(const std::string& user_id,
                                             const std::string& agent_type) const;

    /**
     * @brief Remove one agent and run its release hook
     * @return true if the agent existed
     */
    bool remove_user_agent(const std::string& user_id, const std::string& agent_type);

    /**
     * @brief Remove the whole session and release its agents
     *
     * The user's event channel goes with it, queued events included.
     * Idempotent: an absent session reports status "no_session" and zero
     * agents. Never throws.
     */
    SessionCleanupReport cleanup_user_session(const std::string& user_id);

    /**
     * @brief Swap in a fresh empty session, then release the old one
     *
     * The new session is in place before the old agents are released, so
     * the user is never without a session. The event channel is kept.
     */
    ResetReport reset_user_agents(const std::string& user_id);

    /// Read-only snapshot of every session with anomalies.
    [[nodiscard]] MonitoringReport monitor_all_users() const;

    /// Lifecycle classification for one user; nullopt without a session.
    [[nodiscard]] std::optional<AgentLifecycleManager::UserHealth> monitor_user(
        const std::string& user_id) const;

    /**
     * @brief Remove every session and its event channel; partial failures
     * go into the report
     */
    EmergencyCleanupReport emergency_cleanup_all();

    /**
     * @brief Reclaim least-recently-active sessions while over a ceiling
     * @return number of sessions reclaimed
     */
    size_t enforce_resource_limits();

    /**
     * @brief Clean up sessions idle for longer than max_idle
     * @return number of sessions removed
     */
    size_t cleanup_inactive_sessions(std::chrono::milliseconds max_idle);

    /// Attach the bridge to every existing and future session.
    void set_event_bridge(std::shared_ptr<EventBridge> bridge);

    [[nodiscard]] std::shared_ptr<EventBridge> event_bridge() const;

    [[nodiscard]] EventWiringReport diagnose_event_wiring() const;

    [[nodiscard]] RegistryHealth get_registry_health() const;

    [[nodiscard]] size_t session_count() const;

    [[nodiscard]] std::vector<std::string> list_users() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    using SessionMap = std::unordered_map<std::string, std::shared_ptr<UserAgentSession>>;

    [[nodiscard]] std::shared_ptr<const SessionMap> snapshot() const;

    // Erase user_id from the map; returns the removed session or nullptr
    [[nodiscard]] std::shared_ptr<UserAgentSession> detach_session(const std::string& user_id);

    [[nodiscard]] std::vector<SessionMetrics> collect_metrics() const;

    void notify_creation_failure(const std::string& user_id,
                                 const ExecutionContext& context,
                                 const std::string& agent_type,
                                 const std::string& message,
                                 bool degraded) const;

    // Removes the user's bridge channel (connection and queued events) on teardown
    void drop_event_channel(const std::string& user_id, const UserAgentSession& session) const;

    static constexpr int kMaxSessionAttempts = 3;

    Config config_;
    std::shared_ptr<AgentFactoryRegistry> factories_;
    std::shared_ptr<AgentLifecycleManager> lifecycle_;
    std::shared_ptr<DegradationManager> degradation_;
    const SteadyTime started_at_;

    // RCU: readers copy the pointer, writers swap the entire map.
    // bridge_ is guarded by the same mutex so new sessions never miss it.
    std::shared_ptr<const SessionMap> sessions_;
    std::shared_ptr<EventBridge> bridge_;
    mutable std::shared_mutex mutex_;
};

} // namespace agentcore
