#pragma once

#include "core/types.hpp"
#include "events/event_bridge.hpp"
#include "events/user_event_emitter.hpp"
#include "session/agent.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcore {

/**
 * @brief Point-in-time view of one session, safe to use without its lock
 */
struct SessionMetrics {
    std::string user_id;
    size_t agent_count = 0;
    bool has_event_bridge = false;
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds idle{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

struct SessionCleanupReport {
    std::string user_id;
    std::string status;          // "cleaned" or "no_session"
    size_t cleaned_agents = 0;
    std::vector<std::string> errors;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief All agent state of exactly one user
 *
 * Every member is guarded by the session's own mutex, so operations on
 * different users never contend. Once closed (by cleanup or reset) the
 * session refuses new agents; callers re-resolve a fresh session from the
 * registry.
 */
class UserAgentSession {
public:
    using Builder = std::function<AgentHandle()>;

    explicit UserAgentSession(std::string user_id, std::shared_ptr<EventBridge> bridge = nullptr);

    UserAgentSession(const UserAgentSession&) = delete;
    UserAgentSession& operator=(const UserAgentSession&) = delete;

    [[nodiscard]] const std::string& user_id() const { return user_id_; }
    [[nodiscard]] SystemTime created_at() const { return created_at_; }

    /**
     * @brief Return the agent of this type, or register the one build() produces
     *
     * build() runs under the session lock. If it throws, nothing is
     * registered and the exception propagates.
     *
     * @param created set to true when build() ran and its agent was stored
     * @return the agent, or nullptr if the session is closed
     */
    [[nodiscard]] AgentHandle get_or_create(const std::string& agent_type, const Builder& build,
                                            bool& created);

    /// Pure lookup; does not count as activity.
    [[nodiscard]] AgentHandle get_agent(const std::string& agent_type) const;

    /**
     * @brief Unregister an agent without releasing it
     * @return the removed agent, or nullptr if absent
     */
    [[nodiscard]] AgentHandle take_agent(const std::string& agent_type);

    [[nodiscard]] std::vector<std::string> agent_types() const;
    [[nodiscard]] size_t agent_count() const;

    void set_event_bridge(std::shared_ptr<EventBridge> bridge);
    [[nodiscard]] std::shared_ptr<EventBridge> event_bridge() const;
    [[nodiscard]] bool has_event_bridge() const;

    /// Emitter bound to this user and the given thread, using the current bridge.
    [[nodiscard]] std::shared_ptr<UserEventEmitter> make_emitter(
        const std::optional<std::string>& thread_id) const;

    void touch();

    [[nodiscard]] SessionMetrics metrics() const;

    /**
     * @brief Close the session and release every agent
     *
     * Release hooks run outside the lock. Errors are collected, never
     * thrown. A second close reports zero agents.
     */
    SessionCleanupReport close();

    [[nodiscard]] bool is_closed() const;

private:
    const std::string user_id_;
    const SystemTime created_at_;
    const SteadyTime created_steady_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AgentHandle> agents_;
    std::shared_ptr<EventBridge> bridge_;
    SteadyTime last_activity_;
    bool closed_ = false;
};

} // namespace agentcore
