#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentcore {

/**
 * @brief Structured progress/result event destined for exactly one user
 *
 * Wire shape:
 *   { "type": "...", "payload": {...}, "user_id": "...",
 *     "thread_id": "..." | null, "timestamp": <epoch millis> }
 */
struct Event {
    EventType type = EventType::CUSTOM;
    nlohmann::json payload = nlohmann::json::object();
    std::string user_id;
    std::optional<std::string> thread_id;
    SystemTime timestamp;

    [[nodiscard]] static Event make(EventType type,
                                    std::string user_id,
                                    nlohmann::json payload = nlohmann::json::object(),
                                    std::optional<std::string> thread_id = std::nullopt);

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] std::string serialize() const { return to_json().dump(); }
};

} // namespace agentcore
