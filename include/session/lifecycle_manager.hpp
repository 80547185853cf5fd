#pragma once

#include "core/types.hpp"
#include "session/user_agent_session.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace agentcore {

/**
 * @brief Resource policy for sessions and agents
 *
 * Works purely on SessionMetrics snapshots; it never touches a session
 * directly. The registry asks it for classifications and reclaim order
 * and carries out the cleanup itself.
 */
class AgentLifecycleManager {
public:
    struct Config {
        size_t max_agents_per_user = 50;
        size_t warning_agents_per_user = 40;
        std::chrono::seconds max_session_age{24 * 3600};
        size_t max_sessions = 50;
        size_t max_total_agents = 500;
        double warning_fraction = 0.8;
        uint64_t estimated_bytes_per_agent = 4ULL * 1024 * 1024;
        std::chrono::seconds max_idle{3600};
    };

    struct UserHealth {
        std::string user_id;
        HealthClassification status = HealthClassification::HEALTHY;
        std::vector<std::string> issues;
        size_t agent_count = 0;
        uint64_t estimated_bytes = 0;
        SessionMetrics metrics;

        [[nodiscard]] nlohmann::json to_json() const;
    };

    struct ProcessHealth {
        HealthClassification status = HealthClassification::HEALTHY;
        size_t total_sessions = 0;
        size_t total_agents = 0;
        uint64_t estimated_bytes = 0;
        std::vector<std::string> issues;

        [[nodiscard]] nlohmann::json to_json() const;
    };

    AgentLifecycleManager();
    explicit AgentLifecycleManager(Config config);

    /**
     * @brief Classify one session
     *
     * critical: agent_count > max_agents_per_user
     * warning:  agent_count >= warning_agents_per_user, or older than max_session_age
     */
    [[nodiscard]] UserHealth monitor_memory_usage(const SessionMetrics& metrics) const;

    /**
     * @brief Classify the whole process
     *
     * critical: sessions > max_sessions or total agents > max_total_agents
     * warning:  either count at or above warning_fraction of its ceiling
     */
    [[nodiscard]] ProcessHealth classify_process(const std::vector<SessionMetrics>& sessions) const;

    /**
     * @brief Users to reclaim, least-recently-active first
     *
     * Empty unless a ceiling is exceeded. Picks enough sessions to bring
     * the count back to max_sessions and the agent total back to
     * max_total_agents.
     */
    [[nodiscard]] std::vector<std::string> select_for_reclaim(
        std::vector<SessionMetrics> sessions) const;

    /// Users idle for longer than max_idle, most idle first.
    [[nodiscard]] std::vector<std::string> select_inactive(
        std::vector<SessionMetrics> sessions, std::chrono::milliseconds max_idle) const;

    void record_reclaimed(size_t count);

    [[nodiscard]] uint64_t total_reclaimed() const {
        return reclaimed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    std::atomic<uint64_t> reclaimed_{0};
};

} // namespace agentcore
