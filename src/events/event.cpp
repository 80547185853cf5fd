#include "events/event.hpp"
#include "core/utils.hpp"

namespace agentcore {

Event Event::make(EventType type, std::string user_id, nlohmann::json payload,
                  std::optional<std::string> thread_id) {
    Event event;
    event.type = type;
    event.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
    event.user_id = std::move(user_id);
    event.thread_id = std::move(thread_id);
    event.timestamp = utils::now();
    return event;
}

nlohmann::json Event::to_json() const {
    nlohmann::json j;
    j["type"] = event_type_to_string(type);
    j["payload"] = payload;
    j["user_id"] = user_id;
    if (thread_id) {
        j["thread_id"] = *thread_id;
    } else {
        j["thread_id"] = nullptr;
    }
    j["timestamp"] = utils::epoch_millis(timestamp);
    return j;
}

} // namespace agentcore
