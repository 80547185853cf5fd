#pragma once

#include "events/event_bridge.hpp"
#include <memory>
#include <optional>
#include <string>

namespace agentcore {

/**
 * @brief Event emitter bound to one user and one thread
 *
 * Agents receive an emitter instead of the bridge, so every event they
 * produce is addressed to the user that created them. Without a bridge the
 * emitter is inert and every notify returns false.
 */
class UserEventEmitter {
public:
    UserEventEmitter(std::string user_id,
                     std::optional<std::string> thread_id,
                     std::shared_ptr<EventBridge> bridge);

    [[nodiscard]] const std::string& user_id() const { return user_id_; }
    [[nodiscard]] const std::optional<std::string>& thread_id() const { return thread_id_; }
    [[nodiscard]] bool has_bridge() const { return bridge_ != nullptr; }

    /// @return true if the event reached the bridge (delivered or queued)
    bool emit(EventType type, nlohmann::json payload);

    bool notify_agent_started(const std::string& agent_name,
                              const nlohmann::json& context = nlohmann::json::object());
    bool notify_agent_thinking(const std::string& agent_name, const std::string& reasoning,
                               std::optional<int> step_number = std::nullopt,
                               std::optional<double> progress_percentage = std::nullopt);
    bool notify_tool_executing(const std::string& agent_name, const std::string& tool_name,
                               const nlohmann::json& parameters = nlohmann::json::object());
    bool notify_tool_completed(const std::string& agent_name, const std::string& tool_name,
                               const nlohmann::json& result = nlohmann::json::object(),
                               std::optional<double> execution_time_ms = std::nullopt);
    bool notify_agent_completed(const std::string& agent_name,
                                const nlohmann::json& result = nlohmann::json::object(),
                                std::optional<double> execution_time_ms = std::nullopt);
    bool notify_agent_error(const std::string& agent_name, const std::string& error_message,
                            const nlohmann::json& error_context = nlohmann::json::object());
    bool notify_agent_death(const std::string& agent_name, const std::string& death_cause);
    bool notify_progress_update(const std::string& agent_name, const nlohmann::json& progress);
    bool notify_custom(const std::string& agent_name, const std::string& notification_type,
                       const nlohmann::json& data);

private:
    std::string user_id_;
    std::optional<std::string> thread_id_;
    std::shared_ptr<EventBridge> bridge_;
};

} // namespace agentcore
