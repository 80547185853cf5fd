#include "events/event_sanitizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>
#include <unordered_set>

namespace agentcore::sanitize {

namespace {

constexpr std::array<std::string_view, 6> kSensitiveFragments = {
    "password", "secret", "key", "token", "auth", "credential"
};

bool is_sensitive_key(const std::string& key) {
    const std::string lower = utils::to_lower(key);
    return std::any_of(kSensitiveFragments.begin(), kSensitiveFragments.end(),
                       [&lower](std::string_view frag) {
                           return lower.find(frag) != std::string::npos;
                       });
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

nlohmann::json cut_strings(const nlohmann::json& data, size_t max_len) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : data.items()) {
        if (value.is_string()) {
            out[key] = utils::truncate(value.get<std::string>(), max_len);
        } else if (value.is_object()) {
            out[key] = cut_strings(value, max_len);
        } else {
            out[key] = value;
        }
    }
    return out;
}

} // anonymous namespace

nlohmann::json parameters(const nlohmann::json& params) {
    if (!params.is_object()) return nlohmann::json::object();

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : params.items()) {
        if (is_sensitive_key(key)) {
            out[key] = kRedacted;
        } else if (value.is_string()) {
            out[key] = utils::truncate(value.get<std::string>(), kMaxParameterLength);
        } else if (value.is_object()) {
            out[key] = parameters(value);
        } else {
            out[key] = value;
        }
    }
    return out;
}

nlohmann::json result(const nlohmann::json& value) {
    if (!value.is_object()) return nlohmann::json::object();

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, item] : value.items()) {
        if (item.is_string()) {
            out[key] = utils::truncate(item.get<std::string>(), kMaxResultLength);
        } else if (item.is_object()) {
            out[key] = result(item);
        } else if (item.is_array() && item.size() > kMaxResultListItems) {
            nlohmann::json cut = nlohmann::json::array();
            for (size_t i = 0; i < kMaxResultListItems; ++i) {
                cut.push_back(item[i]);
            }
            cut.push_back("...(truncated)");
            out[key] = std::move(cut);
        } else {
            out[key] = item;
        }
    }
    return out;
}

std::string error_message(const std::string& error) {
    if (error.empty()) return "An error occurred";

    std::string sanitized = error;
    replace_all(sanitized, "/Users/", "/home/");
    replace_all(sanitized, "/home/", "[PATH]/");
    return utils::truncate(sanitized, kMaxErrorLength);
}

nlohmann::json error_context(const nlohmann::json& context) {
    if (!context.is_object() || context.empty()) return nlohmann::json::object();

    return {
        {"error_type", context.value("error_type", std::string("unknown"))},
        {"agent_step", context.value("agent_step", std::string("unknown"))},
        {"user_facing", true}
    };
}

nlohmann::json progress(const nlohmann::json& progress) {
    static const std::unordered_set<std::string> allowed = {
        "percentage", "current_step", "total_steps", "message",
        "status", "estimated_remaining", "progress_type"
    };

    nlohmann::json out = nlohmann::json::object();
    if (!progress.is_object()) return out;
    for (const auto& [key, value] : progress.items()) {
        if (allowed.contains(key)) {
            out[key] = value;
        }
    }
    return out;
}

nlohmann::json custom(const nlohmann::json& data) {
    if (!data.is_object()) return nlohmann::json::object();
    return cut_strings(data, kMaxCustomLength);
}

std::string death_message(const std::string& cause, const std::string& agent_name) {
    if (cause == "timeout") {
        return std::format("The {} agent took too long to respond and has been stopped. Please try again.",
                           agent_name);
    }
    if (cause == "no_heartbeat") {
        return std::format("Lost connection with the {} agent. Please refresh and try again.", agent_name);
    }
    if (cause == "silent_failure") {
        return std::format("The {} agent stopped unexpectedly. Please refresh the page.", agent_name);
    }
    if (cause == "memory_limit") {
        return std::format("The {} agent ran out of resources. Please try with a simpler request.",
                           agent_name);
    }
    if (cause == "cancelled") {
        return std::format("The {} agent was cancelled. You can start a new request.", agent_name);
    }
    return std::format("The {} agent encountered a critical error. Please refresh and try again.",
                       agent_name);
}

} // namespace agentcore::sanitize
