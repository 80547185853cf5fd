#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "runtime/agent_runtime.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <string>
#include <thread>

using namespace agentcore;

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int /*signal*/) {
    g_stop.store(true, std::memory_order_release);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Agent core service starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/agentcore.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        CoreConfig config;
        if (std::filesystem::exists(config_file)) {
            auto result = ConfigLoader::load_from_file(config_file);
            if (!result.success) {
                utils::log::error(result.error_message);
                return 1;
            }
            config = std::move(result.config);
        } else {
            utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
        }

        utils::log::info("[2/4] Building runtime...");
        AgentRuntime runtime(config);
        runtime.init();

        const auto& lc = runtime.config().lifecycle;
        utils::log::info(std::format("[3/4] Limits: {} agents/user, {} sessions, {} agents total",
                                     lc.max_agents_per_user, lc.max_sessions, lc.max_total_agents));

        const auto interval = runtime.config().registry.monitor_interval;
        utils::log::info(std::format("[4/4] Monitoring every {}ms; Ctrl-C to stop", interval.count()));

        auto next_cycle = std::chrono::steady_clock::now() + interval;
        while (!g_stop.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (std::chrono::steady_clock::now() < next_cycle) {
                continue;
            }
            next_cycle += interval;

            const auto report = runtime.run_monitoring_cycle();
            utils::log::info(std::format("Monitor: {} users, {} agents, level={}, reclaimed={}, idle_removed={}",
                report.monitoring.total_users, report.monitoring.total_agents,
                degradation_level_to_string(report.degradation.level),
                report.reclaimed_sessions, report.idle_sessions_removed));
            utils::log::debug(report.to_json().dump());
        }

        utils::log::info("Signal received, shutting down...");
        const auto shutdown_report = runtime.shutdown();
        utils::log::info(std::format("Shutdown complete: {}", shutdown_report.to_json().dump()));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
