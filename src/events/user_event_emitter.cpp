#include "events/user_event_emitter.hpp"

namespace agentcore {

UserEventEmitter::UserEventEmitter(std::string user_id,
                                   std::optional<std::string> thread_id,
                                   std::shared_ptr<EventBridge> bridge)
    : user_id_(std::move(user_id)),
      thread_id_(std::move(thread_id)),
      bridge_(std::move(bridge)) {}

bool UserEventEmitter::emit(EventType type, nlohmann::json payload) {
    if (!bridge_) return false;
    (void)bridge_->emit(user_id_, Event::make(type, user_id_, std::move(payload), thread_id_));
    return true;
}

bool UserEventEmitter::notify_agent_started(const std::string& agent_name,
                                            const nlohmann::json& context) {
    if (!bridge_) return false;
    (void)bridge_->notify_agent_started(user_id_, thread_id_, agent_name, context);
    return true;
}

bool UserEventEmitter::notify_agent_thinking(const std::string& agent_name,
                                             const std::string& reasoning,
                                             std::optional<int> step_number,
                                             std::optional<double> progress_percentage) {
    if (!bridge_) return false;
    (void)bridge_->notify_agent_thinking(user_id_, thread_id_, agent_name, reasoning,
                                         step_number, progress_percentage);
    return true;
}

bool UserEventEmitter::notify_tool_executing(const std::string& agent_name,
                                             const std::string& tool_name,
                                             const nlohmann::json& parameters) {
    if (!bridge_) return false;
    (void)bridge_->notify_tool_executing(user_id_, thread_id_, agent_name, tool_name, parameters);
    return true;
}

bool UserEventEmitter::notify_tool_completed(const std::string& agent_name,
                                             const std::string& tool_name,
                                             const nlohmann::json& result,
                                             std::optional<double> execution_time_ms) {
    if (!bridge_) return false;
    (void)bridge_->notify_tool_completed(user_id_, thread_id_, agent_name, tool_name,
                                         result, execution_time_ms);
    return true;
}

bool UserEventEmitter::notify_agent_completed(const std::string& agent_name,
                                              const nlohmann::json& result,
                                              std::optional<double> execution_time_ms) {
    if (!bridge_) return false;
    (void)bridge_->notify_agent_completed(user_id_, thread_id_, agent_name, result,
                                          execution_time_ms);
    return true;
}

bool UserEventEmitter::notify_agent_error(const std::string& agent_name,
                                          const std::string& error_message,
                                          const nlohmann::json& error_context) {
    if (!bridge_) return false;
    (void)bridge_->notify_agent_error(user_id_, thread_id_, agent_name, error_message,
                                      error_context);
    return true;
}

bool UserEventEmitter::notify_agent_death(const std::string& agent_name,
                                          const std::string& death_cause) {
    if (!bridge_) return false;
    (void)bridge_->notify_agent_death(user_id_, thread_id_, agent_name, death_cause);
    return true;
}

bool UserEventEmitter::notify_progress_update(const std::string& agent_name,
                                              const nlohmann::json& progress) {
    if (!bridge_) return false;
    (void)bridge_->notify_progress_update(user_id_, thread_id_, agent_name, progress);
    return true;
}

bool UserEventEmitter::notify_custom(const std::string& agent_name,
                                     const std::string& notification_type,
                                     const nlohmann::json& data) {
    if (!bridge_) return false;
    (void)bridge_->notify_custom(user_id_, thread_id_, agent_name, notification_type, data);
    return true;
}

} // namespace agentcore
