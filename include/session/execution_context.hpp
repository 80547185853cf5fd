#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentcore {

/**
 * @brief Caller-supplied context for one agent run
 *
 * Produced by the (external) auth and request layer and trusted as is.
 * user_id and run_id are required; thread_id correlates events with a
 * conversation. An optional deadline bounds agent creation.
 */
struct ExecutionContext {
    std::string user_id;
    std::optional<std::string> thread_id;
    std::string run_id;
    std::string request_id;
    std::unordered_map<std::string, std::string> metadata;
    std::optional<Deadline> deadline;

    /**
     * @brief Throw ContextValidationError naming every missing required field
     */
    void validate() const;

    [[nodiscard]] bool deadline_passed() const;

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace agentcore
