#pragma once

#include "events/event.hpp"
#include "events/event_transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcore {

class DegradationManager;

enum class DeliveryOutcome {
    DELIVERED,  // Sent on the live connection
    QUEUED      // Held in the user's bounded queue
};

/**
 * @brief Per-user event routing with degraded-mode buffering
 *
 * Each user gets a channel: an optional live connection, a transport health
 * flag and a bounded FIFO of pending events. Channels are created on demand
 * and guarded by their own mutex, so emitters for different users never
 * contend.
 *
 * Delivery rules:
 * - Immediate send only if the connection is attached, the user's transport
 *   is healthy and the transport service is healthy in the DegradationManager.
 * - Otherwise the event is queued. On overflow the oldest event is evicted
 *   and a history_truncated marker is delivered ahead of the next flush.
 * - A failed or timed-out send marks the user's transport unhealthy and
 *   queues the event; it is not retried synchronously.
 * - Pending events are always flushed, in order, before a newer event.
 */
class EventBridge {
public:
    struct Config {
        size_t queue_capacity = 100;
        std::chrono::milliseconds send_timeout{250};
        std::string transport_service = "websocket";
    };

    struct Stats {
        uint64_t emitted = 0;
        uint64_t delivered = 0;
        uint64_t queued = 0;
        uint64_t evicted = 0;
        uint64_t send_failures = 0;
        uint64_t flushes = 0;
        size_t channels = 0;
        size_t connected_channels = 0;
        size_t pending_events = 0;
    };

    struct ChannelStats {
        std::string user_id;
        bool connected = false;
        bool transport_healthy = true;
        size_t pending = 0;
        uint64_t delivered = 0;
        uint64_t queued = 0;
        uint64_t evicted = 0;
        uint64_t send_failures = 0;
    };

    EventBridge();
    explicit EventBridge(Config config,
                         std::shared_ptr<DegradationManager> degradation = nullptr);
    ~EventBridge();

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;
    EventBridge(EventBridge&&) = delete;
    EventBridge& operator=(EventBridge&&) = delete;

    /**
     * @brief Attach a user's live connection; pending events are flushed.
     */
    void attach_connection(const std::string& user_id, std::shared_ptr<IEventTransport> transport);

    /**
     * @brief Detach the live connection; later events are queued.
     */
    void detach_connection(const std::string& user_id);

    [[nodiscard]] bool has_connection(const std::string& user_id) const;

    /**
     * @brief Route an event to its user's channel
     *
     * An event with an empty user_id is stamped with user_id. A different
     * non-empty user_id throws IsolationViolationError.
     */
    DeliveryOutcome emit(const std::string& user_id, Event event);

    /**
     * @brief Mark one user's transport up or down; up flushes pending events.
     */
    void set_transport_healthy(const std::string& user_id, bool healthy);

    /**
     * @brief Try to deliver a user's pending events now.
     * @return number of events delivered (marker included)
     */
    size_t flush(const std::string& user_id);

    /// Flush every channel; used when the transport service recovers.
    size_t flush_all();

    [[nodiscard]] size_t queued_count(const std::string& user_id) const;

    [[nodiscard]] std::optional<ChannelStats> channel_stats(const std::string& user_id) const;

    [[nodiscard]] Stats get_stats() const;

    /**
     * @brief Drop a user's channel and anything still queued on it.
     * @return true if the channel existed
     */
    bool remove_channel(const std::string& user_id);

    [[nodiscard]] size_t channel_count() const;

    [[nodiscard]] const Config& config() const { return config_; }

    // ========================================================================
    // Typed notifications (payloads sanitized for user display)
    // ========================================================================

    DeliveryOutcome notify_agent_started(const std::string& user_id,
                                         const std::optional<std::string>& thread_id,
                                         const std::string& agent_name,
                                         const nlohmann::json& context = nlohmann::json::object());

    DeliveryOutcome notify_agent_thinking(const std::string& user_id,
                                          const std::optional<std::string>& thread_id,
                                          const std::string& agent_name,
                                          const std::string& reasoning,
                                          std::optional<int> step_number = std::nullopt,
                                          std::optional<double> progress_percentage = std::nullopt);

    DeliveryOutcome notify_tool_executing(const std::string& user_id,
                                          const std::optional<std::string>& thread_id,
                                          const std::string& agent_name,
                                          const std::string& tool_name,
                                          const nlohmann::json& parameters = nlohmann::json::object());

    DeliveryOutcome notify_tool_completed(const std::string& user_id,
                                          const std::optional<std::string>& thread_id,
                                          const std::string& agent_name,
                                          const std::string& tool_name,
                                          const nlohmann::json& result = nlohmann::json::object(),
                                          std::optional<double> execution_time_ms = std::nullopt);

    DeliveryOutcome notify_agent_completed(const std::string& user_id,
                                           const std::optional<std::string>& thread_id,
                                           const std::string& agent_name,
                                           const nlohmann::json& result = nlohmann::json::object(),
                                           std::optional<double> execution_time_ms = std::nullopt);

    DeliveryOutcome notify_agent_error(const std::string& user_id,
                                       const std::optional<std::string>& thread_id,
                                       const std::string& agent_name,
                                       const std::string& error_message,
                                       const nlohmann::json& error_context = nlohmann::json::object());

    DeliveryOutcome notify_agent_death(const std::string& user_id,
                                       const std::optional<std::string>& thread_id,
                                       const std::string& agent_name,
                                       const std::string& death_cause);

    DeliveryOutcome notify_progress_update(const std::string& user_id,
                                           const std::optional<std::string>& thread_id,
                                           const std::string& agent_name,
                                           const nlohmann::json& progress);

    DeliveryOutcome notify_custom(const std::string& user_id,
                                  const std::optional<std::string>& thread_id,
                                  const std::string& agent_name,
                                  const std::string& notification_type,
                                  const nlohmann::json& data);

private:
    struct Channel {
        explicit Channel(std::string uid) : user_id(std::move(uid)) {}

        const std::string user_id;
        mutable std::mutex mutex;
        std::shared_ptr<IEventTransport> connection;
        bool transport_healthy = true;
        std::deque<Event> pending;
        uint64_t evicted_since_flush = 0;

        uint64_t delivered = 0;
        uint64_t queued = 0;
        uint64_t evicted = 0;
        uint64_t send_failures = 0;
    };

    [[nodiscard]] std::shared_ptr<Channel> get_or_create_channel(const std::string& user_id);
    [[nodiscard]] std::shared_ptr<Channel> find_channel(const std::string& user_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Channel>> snapshot_channels() const;

    // All *_locked helpers require ch.mutex held
    [[nodiscard]] bool can_deliver_locked(const Channel& ch) const;
    [[nodiscard]] bool send_locked(Channel& ch, const Event& event);
    void enqueue_locked(Channel& ch, Event event);
    [[nodiscard]] bool flush_locked(Channel& ch, size_t& delivered);

    Config config_;
    std::shared_ptr<DegradationManager> degradation_;
    uint64_t listener_id_ = 0;

    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
    mutable std::shared_mutex channels_mutex_;

    std::atomic<uint64_t> emitted_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> queued_{0};
    std::atomic<uint64_t> evicted_{0};
    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> flushes_{0};
};

} // namespace agentcore
