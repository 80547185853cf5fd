#pragma once

#include "config/config_loader.hpp"
#include "events/event_bridge.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include "resilience/degradation_manager.hpp"
#include "session/agent_factory_registry.hpp"
#include "session/agent_registry.hpp"
#include "session/lifecycle_manager.hpp"

#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace agentcore {

struct MonitoringCycleReport {
    MonitoringReport monitoring;
    size_t reclaimed_sessions = 0;
    size_t idle_sessions_removed = 0;
    DegradationStatus degradation;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct RuntimeShutdownReport {
    bool drained = false;
    uint32_t in_flight_at_shutdown = 0;
    size_t events_flushed = 0;
    EmergencyCleanupReport cleanup;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Composition root for the agent core
 *
 * Owns one instance of every component and wires them together in init():
 * breakers report to the degradation manager, the bridge consults it, and
 * the registry receives all of them. Nothing in the core is a process-wide
 * singleton; tests build as many runtimes as they like.
 *
 * The factory registry exists from construction so agent types can be
 * registered before or after init().
 *
 * Agent operations issued through the runtime (create, reset, cleanup,
 * monitoring) are admitted only while it is running. shutdown() closes
 * admission first, then waits up to shutdown.drain_timeout for the
 * admitted ones before releasing every session.
 */
class AgentRuntime {
public:
    explicit AgentRuntime(CoreConfig config = CoreConfig());
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    /**
     * @brief Build and wire all components
     * @throws std::logic_error if already initialized
     */
    void init();

    /**
     * @brief Stop admitting operations, drain, then clean up every session
     *
     * Safe to call more than once; later calls return an empty report.
     */
    RuntimeShutdownReport shutdown();

    [[nodiscard]] bool is_running() const;

    /**
     * @brief Create an agent for a user
     * @throws ServiceUnavailableError if not running or shutting down
     */
    [[nodiscard]] AgentHandle create_agent(const std::string& user_id,
                                           const std::string& agent_type,
                                           const ExecutionContext& context);

    /// @throws ServiceUnavailableError if not running or shutting down
    ResetReport reset_user(const std::string& user_id);

    /// @throws ServiceUnavailableError if not running or shutting down
    SessionCleanupReport cleanup_user(const std::string& user_id);

    /// Agent operations admitted and not yet finished.
    [[nodiscard]] uint32_t active_operations() const;

    /**
     * @brief Periodic maintenance: monitor, enforce ceilings, drop idle sessions
     *
     * Returns an empty report when the runtime is not admitting operations.
     */
    MonitoringCycleReport run_monitoring_cycle();

    [[nodiscard]] const CoreConfig& config() const { return config_; }

    // Components (null before init(), except factories)
    [[nodiscard]] std::shared_ptr<AgentFactoryRegistry> factories() const { return factories_; }
    [[nodiscard]] std::shared_ptr<DegradationManager> degradation() const { return degradation_; }
    [[nodiscard]] std::shared_ptr<CircuitBreakerRegistry> breakers() const { return breakers_; }
    [[nodiscard]] std::shared_ptr<EventBridge> bridge() const { return bridge_; }
    [[nodiscard]] std::shared_ptr<AgentLifecycleManager> lifecycle() const { return lifecycle_; }
    [[nodiscard]] std::shared_ptr<AgentRegistry> registry() const { return registry_; }

private:
    enum class Phase { CREATED, RUNNING, DRAINING, STOPPED };

    // Ends an admitted operation on scope exit
    class ActiveOperation {
    public:
        explicit ActiveOperation(AgentRuntime& runtime) : runtime_(runtime) {}
        ~ActiveOperation() { runtime_.end_operation(); }

        ActiveOperation(const ActiveOperation&) = delete;
        ActiveOperation& operator=(const ActiveOperation&) = delete;

    private:
        AgentRuntime& runtime_;
    };

    /// Counts the operation in when RUNNING; otherwise logs and refuses.
    [[nodiscard]] bool begin_operation(std::string_view operation);
    void end_operation();

    /// begin_operation() that throws ServiceUnavailableError on refusal.
    void require_operation(std::string_view operation);

    CoreConfig config_;

    std::shared_ptr<AgentFactoryRegistry> factories_;
    std::shared_ptr<DegradationManager> degradation_;
    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    std::shared_ptr<EventBridge> bridge_;
    std::shared_ptr<AgentLifecycleManager> lifecycle_;
    std::shared_ptr<AgentRegistry> registry_;

    mutable std::mutex lifecycle_mutex_;  // serializes init/shutdown

    // Admission state; phase_ only moves forward
    mutable std::mutex gate_mutex_;
    std::condition_variable drained_;
    Phase phase_ = Phase::CREATED;
    uint32_t active_operations_ = 0;
};

} // namespace agentcore
