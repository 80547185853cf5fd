#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace agentcore::sanitize {

// Limits applied before data reaches a user's channel
inline constexpr size_t kMaxParameterLength = 200;
inline constexpr size_t kMaxResultLength = 500;
inline constexpr size_t kMaxResultListItems = 10;
inline constexpr size_t kMaxErrorLength = 300;
inline constexpr size_t kMaxCustomLength = 1000;

inline constexpr const char* kRedacted = "[REDACTED]";

/**
 * @brief Tool parameters: redact sensitive keys, cut long strings.
 *
 * A key is sensitive if it contains password, secret, key, token, auth or
 * credential (case-insensitive). Nested objects are walked.
 */
[[nodiscard]] nlohmann::json parameters(const nlohmann::json& params);

/**
 * @brief Tool/agent results: cut long strings and long lists.
 */
[[nodiscard]] nlohmann::json result(const nlohmann::json& value);

/**
 * @brief Error text: hide home directory paths, cut to kMaxErrorLength.
 */
[[nodiscard]] std::string error_message(const std::string& error);

/**
 * @brief Error context: keep only error_type and agent_step.
 */
[[nodiscard]] nlohmann::json error_context(const nlohmann::json& context);

/**
 * @brief Progress data: keep only allow-listed keys.
 */
[[nodiscard]] nlohmann::json progress(const nlohmann::json& progress);

/**
 * @brief Custom notification data: cut long strings.
 */
[[nodiscard]] nlohmann::json custom(const nlohmann::json& data);

/**
 * @brief User-facing text for an agent death cause.
 */
[[nodiscard]] std::string death_message(const std::string& cause, const std::string& agent_name);

} // namespace agentcore::sanitize
