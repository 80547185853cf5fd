#include "session/user_agent_session.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace agentcore {

nlohmann::json SessionMetrics::to_json() const {
    return {
        {"user_id", user_id},
        {"agent_count", agent_count},
        {"has_event_bridge", has_event_bridge},
        {"age_seconds", std::chrono::duration<double>(age).count()},
        {"idle_seconds", std::chrono::duration<double>(idle).count()}
    };
}

nlohmann::json SessionCleanupReport::to_json() const {
    return {
        {"user_id", user_id},
        {"status", status},
        {"cleaned_agents", cleaned_agents},
        {"errors", errors}
    };
}

UserAgentSession::UserAgentSession(std::string user_id, std::shared_ptr<EventBridge> bridge)
    : user_id_(std::move(user_id)),
      created_at_(utils::now()),
      created_steady_(std::chrono::steady_clock::now()),
      bridge_(std::move(bridge)),
      last_activity_(created_steady_) {}

AgentHandle UserAgentSession::get_or_create(const std::string& agent_type, const Builder& build,
                                            bool& created) {
    created = false;
    std::lock_guard lock(mutex_);
    if (closed_) {
        return nullptr;
    }

    const auto it = agents_.find(agent_type);
    if (it != agents_.end()) {
        last_activity_ = std::chrono::steady_clock::now();
        return it->second;
    }

    AgentHandle agent = build();
    if (!agent) {
        return nullptr;
    }
    agents_.emplace(agent_type, agent);
    last_activity_ = std::chrono::steady_clock::now();
    created = true;
    return agent;
}

AgentHandle UserAgentSession::get_agent(const std::string& agent_type) const {
    std::lock_guard lock(mutex_);
    const auto it = agents_.find(agent_type);
    return (it != agents_.end()) ? it->second : nullptr;
}

AgentHandle UserAgentSession::take_agent(const std::string& agent_type) {
    std::lock_guard lock(mutex_);
    const auto it = agents_.find(agent_type);
    if (it == agents_.end()) {
        return nullptr;
    }
    AgentHandle agent = std::move(it->second);
    agents_.erase(it);
    last_activity_ = std::chrono::steady_clock::now();
    return agent;
}

std::vector<std::string> UserAgentSession::agent_types() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> types;
    types.reserve(agents_.size());
    for (const auto& [type, _] : agents_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

size_t UserAgentSession::agent_count() const {
    std::lock_guard lock(mutex_);
    return agents_.size();
}

void UserAgentSession::set_event_bridge(std::shared_ptr<EventBridge> bridge) {
    std::lock_guard lock(mutex_);
    bridge_ = std::move(bridge);
}

std::shared_ptr<EventBridge> UserAgentSession::event_bridge() const {
    std::lock_guard lock(mutex_);
    return bridge_;
}

bool UserAgentSession::has_event_bridge() const {
    std::lock_guard lock(mutex_);
    return bridge_ != nullptr;
}

std::shared_ptr<UserEventEmitter> UserAgentSession::make_emitter(
    const std::optional<std::string>& thread_id) const {
    return std::make_shared<UserEventEmitter>(user_id_, thread_id, event_bridge());
}

void UserAgentSession::touch() {
    std::lock_guard lock(mutex_);
    last_activity_ = std::chrono::steady_clock::now();
}

SessionMetrics UserAgentSession::metrics() const {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    SessionMetrics m;
    m.user_id = user_id_;
    m.agent_count = agents_.size();
    m.has_event_bridge = bridge_ != nullptr;
    m.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - created_steady_);
    m.idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity_);
    return m;
}

SessionCleanupReport UserAgentSession::close() {
    std::unordered_map<std::string, AgentHandle> agents;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        agents.swap(agents_);
    }

    SessionCleanupReport report;
    report.user_id = user_id_;
    report.status = "cleaned";
    for (auto& [type, agent] : agents) {
        if (auto err = agent->release()) {
            report.errors.push_back(std::format("{}: {}", type, *err));
            utils::log::warn(std::format("Release of agent '{}' for user '{}' failed: {}",
                                         type, user_id_, *err));
        }
        // Counted even when the hook failed: the agent is gone from the session
        ++report.cleaned_agents;
    }
    return report;
}

bool UserAgentSession::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

} // namespace agentcore
