#include "session/agent.hpp"
#include "core/utils.hpp"

namespace agentcore {

AgentInstance::AgentInstance(std::string user_id, std::string agent_type,
                             std::unique_ptr<IAgent> agent)
    : id_(next_id_.fetch_add(1, std::memory_order_relaxed)),
      user_id_(std::move(user_id)),
      agent_type_(std::move(agent_type)),
      created_at_(utils::now()),
      agent_(std::move(agent)) {}

std::optional<std::string> AgentInstance::release() {
    if (released_.exchange(true, std::memory_order_acq_rel)) {
        return std::nullopt;
    }
    try {
        agent_->release();
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace agentcore
