#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace agentcore {

using SystemTime = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Point in time after which a call or factory should give up.
using Deadline = std::chrono::steady_clock::time_point;

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Single trial call in flight
};

struct CircuitBreakerStats {
    CircuitState state;
    uint32_t consecutive_failures;
    uint64_t total_calls;
    uint64_t failed_calls;
    uint64_t rejected_calls;
    SystemTime last_failure;
    SystemTime opened_at;
    SystemTime last_transition;

    CircuitBreakerStats()
        : state(CircuitState::CLOSED), consecutive_failures(0),
          total_calls(0), failed_calls(0), rejected_calls(0) {}
};

// ============================================================================
// Degradation Types
// ============================================================================

enum class DegradationLevel {
    NORMAL,     // All dependencies healthy
    PARTIAL,    // One non-critical dependency down
    DEGRADED,   // Several down, or a critical one
    MINIMAL     // Majority down, or the whole core set
};

struct DegradationStatus {
    DegradationLevel level = DegradationLevel::NORMAL;
    std::set<std::string> affected_services;
    SystemTime last_recomputed;
};

// ============================================================================
// Lifecycle Types
// ============================================================================

enum class HealthClassification {
    HEALTHY,
    WARNING,
    CRITICAL
};

// ============================================================================
// Event Types
// ============================================================================

enum class EventType {
    AGENT_STARTED,
    AGENT_THINKING,
    TOOL_EXECUTING,
    TOOL_COMPLETED,
    AGENT_COMPLETED,
    AGENT_ERROR,
    AGENT_DEATH,
    PROGRESS_UPDATE,
    CUSTOM,
    HISTORY_TRUNCATED
};

// ============================================================================
// String Conversions
// ============================================================================

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

inline const char* degradation_level_to_string(DegradationLevel level) {
    switch (level) {
        case DegradationLevel::NORMAL: return "normal";
        case DegradationLevel::PARTIAL: return "partial";
        case DegradationLevel::DEGRADED: return "degraded";
        case DegradationLevel::MINIMAL: return "minimal";
        default: return "unknown";
    }
}

inline const char* health_to_string(HealthClassification health) {
    switch (health) {
        case HealthClassification::HEALTHY: return "healthy";
        case HealthClassification::WARNING: return "warning";
        case HealthClassification::CRITICAL: return "critical";
        default: return "unknown";
    }
}

// Wire names of the event schema
inline const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::AGENT_STARTED: return "agent_started";
        case EventType::AGENT_THINKING: return "agent_thinking";
        case EventType::TOOL_EXECUTING: return "tool_executing";
        case EventType::TOOL_COMPLETED: return "tool_completed";
        case EventType::AGENT_COMPLETED: return "agent_completed";
        case EventType::AGENT_ERROR: return "agent_error";
        case EventType::AGENT_DEATH: return "agent_death";
        case EventType::PROGRESS_UPDATE: return "progress_update";
        case EventType::CUSTOM: return "custom";
        case EventType::HISTORY_TRUNCATED: return "history_truncated";
        default: return "unknown";
    }
}

inline std::optional<EventType> event_type_from_string(std::string_view name) {
    static constexpr EventType kAll[] = {
        EventType::AGENT_STARTED, EventType::AGENT_THINKING,
        EventType::TOOL_EXECUTING, EventType::TOOL_COMPLETED,
        EventType::AGENT_COMPLETED, EventType::AGENT_ERROR,
        EventType::AGENT_DEATH, EventType::PROGRESS_UPDATE,
        EventType::CUSTOM, EventType::HISTORY_TRUNCATED
    };
    for (const EventType t : kAll) {
        if (name == event_type_to_string(t)) return t;
    }
    return std::nullopt;
}

} // namespace agentcore
