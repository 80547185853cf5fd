#pragma once

#include "core/types.hpp"
#include "events/user_event_emitter.hpp"
#include "session/execution_context.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace agentcore {

/**
 * @brief Abstract interface for agent state produced by a factory
 *
 * The core never looks inside an agent; it only owns it and calls
 * release() exactly once when the agent leaves its session.
 */
class IAgent {
public:
    virtual ~IAgent() = default;

    /// Release hook. May throw; cleanup paths record the error and continue.
    virtual void release() {}

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Everything a factory may use to build an agent
 *
 * The emitter is bound to context.user_id, so the agent can only reach
 * its own user's channel.
 */
struct AgentContext {
    ExecutionContext execution;
    std::string agent_type;
    std::shared_ptr<UserEventEmitter> emitter;  // never null
};

/**
 * @brief Handle to one registered agent
 *
 * Tagged with its creating user and type; owned by exactly one session.
 * Ids are process-unique, so two handles compare distinct even when the
 * same type is recreated for the same user.
 */
class AgentInstance {
public:
    AgentInstance(std::string user_id, std::string agent_type, std::unique_ptr<IAgent> agent);

    AgentInstance(const AgentInstance&) = delete;
    AgentInstance& operator=(const AgentInstance&) = delete;

    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const std::string& user_id() const { return user_id_; }
    [[nodiscard]] const std::string& agent_type() const { return agent_type_; }
    [[nodiscard]] SystemTime created_at() const { return created_at_; }

    [[nodiscard]] IAgent& agent() { return *agent_; }
    [[nodiscard]] const IAgent& agent() const { return *agent_; }

    /// Typed access for callers that know the concrete agent class.
    template<typename T>
    [[nodiscard]] T* as() { return dynamic_cast<T*>(agent_.get()); }

    /**
     * @brief Run the release hook (once)
     * @return error text if the hook threw, nullopt otherwise
     */
    [[nodiscard]] std::optional<std::string> release();

    [[nodiscard]] bool released() const { return released_.load(std::memory_order_acquire); }

private:
    static inline std::atomic<uint64_t> next_id_{1};

    uint64_t id_;
    std::string user_id_;
    std::string agent_type_;
    SystemTime created_at_;
    std::unique_ptr<IAgent> agent_;
    std::atomic<bool> released_{false};
};

using AgentHandle = std::shared_ptr<AgentInstance>;

} // namespace agentcore
