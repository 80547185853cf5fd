#include "session/agent_factory_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace agentcore {

bool AgentFactoryRegistry::register_factory(const std::string& agent_type, AgentFactory factory) {
    if (agent_type.empty() || !factory) {
        return false;
    }
    std::unique_lock lock(mutex_);
    const bool inserted = factories_.try_emplace(agent_type, std::move(factory)).second;
    if (inserted) {
        utils::log::debug(std::format("Registered agent factory '{}'", agent_type));
    }
    return inserted;
}

bool AgentFactoryRegistry::unregister_factory(const std::string& agent_type) {
    std::unique_lock lock(mutex_);
    return factories_.erase(agent_type) > 0;
}

bool AgentFactoryRegistry::contains(const std::string& agent_type) const {
    std::shared_lock lock(mutex_);
    return factories_.contains(agent_type);
}

std::vector<std::string> AgentFactoryRegistry::list_types() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> types;
    types.reserve(factories_.size());
    for (const auto& [type, _] : factories_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

size_t AgentFactoryRegistry::size() const {
    std::shared_lock lock(mutex_);
    return factories_.size();
}

std::unique_ptr<IAgent> AgentFactoryRegistry::create(const std::string& agent_type,
                                                     const AgentContext& context) const {
    AgentFactory factory;
    {
        std::shared_lock lock(mutex_);
        const auto it = factories_.find(agent_type);
        if (it == factories_.end()) {
            throw FactoryError(std::format("No factory registered for agent type '{}'", agent_type));
        }
        factory = it->second;
    }

    // Run outside the map lock: factories may block on I/O
    std::unique_ptr<IAgent> agent;
    try {
        agent = factory(context);
    } catch (const FactoryError&) {
        throw;
    } catch (const std::exception& e) {
        throw FactoryError(std::format("Factory for '{}' failed: {}", agent_type, e.what()));
    }

    if (!agent) {
        throw FactoryError(std::format("Factory for '{}' returned no agent", agent_type));
    }
    return agent;
}

} // namespace agentcore
