#include "session/execution_context.hpp"
#include "core/error.hpp"

#include <chrono>
#include <format>
#include <vector>

namespace agentcore {

void ExecutionContext::validate() const {
    std::vector<std::string> missing;
    if (user_id.empty()) missing.emplace_back("user_id");
    if (run_id.empty()) missing.emplace_back("run_id");
    if (missing.empty()) return;

    std::string fields;
    for (const auto& f : missing) {
        if (!fields.empty()) fields += ", ";
        fields += f;
    }
    throw ContextValidationError(std::format("Execution context missing required fields: {}", fields));
}

bool ExecutionContext::deadline_passed() const {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

nlohmann::json ExecutionContext::to_json() const {
    nlohmann::json j;
    j["user_id"] = user_id;
    j["thread_id"] = thread_id ? nlohmann::json(*thread_id) : nlohmann::json(nullptr);
    j["run_id"] = run_id;
    j["request_id"] = request_id;
    j["metadata"] = metadata;
    return j;
}

} // namespace agentcore
