#pragma once

#include "events/event_bridge.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/degradation_manager.hpp"
#include "session/agent_registry.hpp"
#include "session/lifecycle_manager.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace agentcore {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct RegistrySection {
    AgentRegistry::Config registry;
    std::chrono::milliseconds monitor_interval{60000};
    bool enforce_limits_on_monitor = true;
    bool cleanup_idle_on_monitor = true;
};

/// [[circuit_breaker.dependencies]] entry
/// [shutdown]: how long shutdown waits for admitted agent operations
struct ShutdownSection {
    std::chrono::milliseconds drain_timeout{30000};
};

struct DependencyBreakerConfig {
    std::string name;
    CircuitBreaker::Config config;
    bool critical = false;
};

struct CircuitBreakerSection {
    CircuitBreaker::Config defaults;
    std::vector<DependencyBreakerConfig> dependencies;
};

// ============================================================================
// CoreConfig - Complete parsed configuration
// ============================================================================

struct CoreConfig {
    LoggingConfig logging;
    RegistrySection registry;
    AgentLifecycleManager::Config lifecycle;
    CircuitBreakerSection circuit_breaker;
    DegradationManager::Config degradation;
    EventBridge::Config event_bridge;
    ShutdownSection shutdown;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads agentcore.toml
 *
 * Every key is optional and falls back to the defaults of the structs
 * above. String values support ${ENV_VAR} expansion; a top-level
 * include = "other.toml" (or array) is merged underneath the main file
 * when loading from disk.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        CoreConfig config;

        static LoadResult ok(CoreConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to agentcore.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config for invalid values
     * @return one message per problem; empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CoreConfig& config);
};

} // namespace agentcore
