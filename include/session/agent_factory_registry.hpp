#pragma once

#include "session/agent.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcore {

/// Builds one agent. May block on external I/O; should honour context.execution.deadline.
using AgentFactory = std::function<std::unique_ptr<IAgent>(const AgentContext& context)>;

/**
 * @brief Agent type -> factory map, filled once at startup
 *
 * The registry holds no agent-specific logic; everything type-specific
 * comes from here.
 */
class AgentFactoryRegistry {
public:
    /**
     * @brief Register a factory
     * @return false if the type is already registered (existing one kept)
     */
    bool register_factory(const std::string& agent_type, AgentFactory factory);

    bool unregister_factory(const std::string& agent_type);

    [[nodiscard]] bool contains(const std::string& agent_type) const;

    [[nodiscard]] std::vector<std::string> list_types() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Invoke the factory for agent_type
     * @throws FactoryError if unregistered, if the factory throws or returns null
     */
    [[nodiscard]] std::unique_ptr<IAgent> create(const std::string& agent_type,
                                                 const AgentContext& context) const;

private:
    std::unordered_map<std::string, AgentFactory> factories_;
    mutable std::shared_mutex mutex_;
};

} // namespace agentcore
