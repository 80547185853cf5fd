#include "events/event_bridge.hpp"
#include "events/event_sanitizer.hpp"
#include "resilience/degradation_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace agentcore {

namespace {

// Transport send() calls in progress on this thread; a channel mutex is held
thread_local int t_send_depth = 0;

} // anonymous namespace

EventBridge::EventBridge()
    : EventBridge(Config{}) {}

EventBridge::EventBridge(Config config, std::shared_ptr<DegradationManager> degradation)
    : config_(std::move(config)),
      degradation_(std::move(degradation)) {
    if (degradation_) {
        listener_id_ = degradation_->add_listener(
            [this](const std::string& service, bool healthy, const DegradationStatus&) {
                if (healthy && service == config_.transport_service) {
                    if (t_send_depth > 0) {
                        // Reported from inside a send; flushing would relock that channel
                        utils::log::debug(std::format(
                            "Transport '{}' recovered during a send, deferring flush", service));
                        return;
                    }
                    const size_t flushed = flush_all();
                    utils::log::info(std::format("Transport '{}' recovered, flushed {} pending events",
                                                 service, flushed));
                }
            });
    }
}

EventBridge::~EventBridge() {
    if (degradation_ && listener_id_ != 0) {
        degradation_->remove_listener(listener_id_);
    }
}

// ============================================================================
// Channel map (double-checked locking, shared_mutex)
// ============================================================================

std::shared_ptr<EventBridge::Channel> EventBridge::get_or_create_channel(const std::string& user_id) {
    {
        std::shared_lock lock(channels_mutex_);
        const auto it = channels_.find(user_id);
        if (it != channels_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(channels_mutex_);
    auto [it, inserted] = channels_.try_emplace(user_id, nullptr);
    if (inserted) {
        it->second = std::make_shared<Channel>(user_id);
    }
    return it->second;
}

std::shared_ptr<EventBridge::Channel> EventBridge::find_channel(const std::string& user_id) const {
    std::shared_lock lock(channels_mutex_);
    const auto it = channels_.find(user_id);
    return (it != channels_.end()) ? it->second : nullptr;
}

std::vector<std::shared_ptr<EventBridge::Channel>> EventBridge::snapshot_channels() const {
    std::shared_lock lock(channels_mutex_);
    std::vector<std::shared_ptr<Channel>> result;
    result.reserve(channels_.size());
    for (const auto& [id, ch] : channels_) {
        result.push_back(ch);
    }
    return result;
}

// ============================================================================
// Connection management
// ============================================================================

void EventBridge::attach_connection(const std::string& user_id,
                                    std::shared_ptr<IEventTransport> transport) {
    auto ch = get_or_create_channel(user_id);
    std::lock_guard lock(ch->mutex);
    const std::string transport_name = transport ? transport->name() : "none";
    ch->connection = std::move(transport);
    ch->transport_healthy = true;

    size_t flushed = 0;
    if (can_deliver_locked(*ch)) {
        (void)flush_locked(*ch, flushed);
    }
    utils::log::debug(std::format("Connection {} attached for user '{}' ({} pending flushed)",
                                  transport_name, user_id, flushed));
}

void EventBridge::detach_connection(const std::string& user_id) {
    const auto ch = find_channel(user_id);
    if (!ch) return;
    std::lock_guard lock(ch->mutex);
    ch->connection.reset();
}

bool EventBridge::has_connection(const std::string& user_id) const {
    const auto ch = find_channel(user_id);
    if (!ch) return false;
    std::lock_guard lock(ch->mutex);
    return ch->connection != nullptr;
}

void EventBridge::set_transport_healthy(const std::string& user_id, bool healthy) {
    auto ch = get_or_create_channel(user_id);
    std::lock_guard lock(ch->mutex);
    ch->transport_healthy = healthy;
    if (healthy && can_deliver_locked(*ch)) {
        size_t flushed = 0;
        (void)flush_locked(*ch, flushed);
    }
}

// ============================================================================
// Emission
// ============================================================================

DeliveryOutcome EventBridge::emit(const std::string& user_id, Event event) {
    if (user_id.empty()) {
        throw ContextValidationError("Event emission requires a user_id");
    }
    if (event.user_id.empty()) {
        event.user_id = user_id;
    } else if (event.user_id != user_id) {
        throw IsolationViolationError(std::format(
            "Event for user '{}' routed to channel of user '{}'", event.user_id, user_id));
    }
    if (event.timestamp == SystemTime{}) {
        event.timestamp = utils::now();
    }
    emitted_.fetch_add(1, std::memory_order_relaxed);

    auto ch = get_or_create_channel(user_id);
    std::lock_guard lock(ch->mutex);

    if (can_deliver_locked(*ch)) {
        size_t flushed = 0;
        // Older events first; a failure on either step leaves the transport unhealthy
        if (flush_locked(*ch, flushed) && send_locked(*ch, event)) {
            return DeliveryOutcome::DELIVERED;
        }
    }

    enqueue_locked(*ch, std::move(event));
    return DeliveryOutcome::QUEUED;
}

size_t EventBridge::flush(const std::string& user_id) {
    const auto ch = find_channel(user_id);
    if (!ch) return 0;
    std::lock_guard lock(ch->mutex);
    size_t flushed = 0;
    if (can_deliver_locked(*ch)) {
        (void)flush_locked(*ch, flushed);
    }
    return flushed;
}

size_t EventBridge::flush_all() {
    size_t total = 0;
    for (const auto& ch : snapshot_channels()) {
        std::lock_guard lock(ch->mutex);
        if (can_deliver_locked(*ch)) {
            size_t flushed = 0;
            (void)flush_locked(*ch, flushed);
            total += flushed;
        }
    }
    return total;
}

bool EventBridge::can_deliver_locked(const Channel& ch) const {
    if (!ch.connection || !ch.transport_healthy) {
        return false;
    }
    return !degradation_ || degradation_->is_service_healthy(config_.transport_service);
}

bool EventBridge::send_locked(Channel& ch, const Event& event) {
    bool ok = false;
    ++t_send_depth;
    try {
        ok = ch.connection->send(event, config_.send_timeout);
        --t_send_depth;
    } catch (const std::exception& e) {
        --t_send_depth;
        utils::log::warn(std::format("Transport {} threw for user '{}': {}",
                                     ch.connection->name(), ch.user_id, e.what()));
    } catch (...) {
        --t_send_depth;
        throw;
    }

    if (ok) {
        ++ch.delivered;
        delivered_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    ch.transport_healthy = false;
    ++ch.send_failures;
    send_failures_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Delivery of {} to user '{}' failed; queuing until transport recovers",
                                 event_type_to_string(event.type), ch.user_id));
    return false;
}

void EventBridge::enqueue_locked(Channel& ch, Event event) {
    if (ch.pending.size() >= config_.queue_capacity) {
        ch.pending.pop_front();
        ++ch.evicted;
        ++ch.evicted_since_flush;
        evicted_.fetch_add(1, std::memory_order_relaxed);
        if (ch.evicted_since_flush == 1) {
            utils::log::warn(std::format("Event queue for user '{}' full ({}), evicting oldest",
                                         ch.user_id, config_.queue_capacity));
        }
    }
    ch.pending.push_back(std::move(event));
    ++ch.queued;
    queued_.fetch_add(1, std::memory_order_relaxed);
}

bool EventBridge::flush_locked(Channel& ch, size_t& delivered) {
    if (ch.pending.empty() && ch.evicted_since_flush == 0) {
        return true;
    }
    flushes_.fetch_add(1, std::memory_order_relaxed);

    if (ch.evicted_since_flush > 0) {
        const Event marker = Event::make(
            EventType::HISTORY_TRUNCATED, ch.user_id,
            {{"dropped_events", ch.evicted_since_flush},
             {"message", "Some earlier progress updates were dropped while your connection was degraded."}},
            ch.pending.empty() ? std::optional<std::string>{} : ch.pending.front().thread_id);
        if (!send_locked(ch, marker)) {
            return false;
        }
        ch.evicted_since_flush = 0;
        ++delivered;
    }

    while (!ch.pending.empty()) {
        if (!send_locked(ch, ch.pending.front())) {
            return false;
        }
        ch.pending.pop_front();
        ++delivered;
    }
    return true;
}

// ============================================================================
// Introspection
// ============================================================================

size_t EventBridge::queued_count(const std::string& user_id) const {
    const auto ch = find_channel(user_id);
    if (!ch) return 0;
    std::lock_guard lock(ch->mutex);
    return ch->pending.size();
}

std::optional<EventBridge::ChannelStats> EventBridge::channel_stats(const std::string& user_id) const {
    const auto ch = find_channel(user_id);
    if (!ch) return std::nullopt;
    std::lock_guard lock(ch->mutex);
    ChannelStats stats;
    stats.user_id = ch->user_id;
    stats.connected = ch->connection != nullptr;
    stats.transport_healthy = ch->transport_healthy;
    stats.pending = ch->pending.size();
    stats.delivered = ch->delivered;
    stats.queued = ch->queued;
    stats.evicted = ch->evicted;
    stats.send_failures = ch->send_failures;
    return stats;
}

EventBridge::Stats EventBridge::get_stats() const {
    Stats stats;
    stats.emitted = emitted_.load(std::memory_order_relaxed);
    stats.delivered = delivered_.load(std::memory_order_relaxed);
    stats.queued = queued_.load(std::memory_order_relaxed);
    stats.evicted = evicted_.load(std::memory_order_relaxed);
    stats.send_failures = send_failures_.load(std::memory_order_relaxed);
    stats.flushes = flushes_.load(std::memory_order_relaxed);

    const auto channels = snapshot_channels();
    stats.channels = channels.size();
    for (const auto& ch : channels) {
        std::lock_guard lock(ch->mutex);
        if (ch->connection) ++stats.connected_channels;
        stats.pending_events += ch->pending.size();
    }
    return stats;
}

bool EventBridge::remove_channel(const std::string& user_id) {
    std::shared_ptr<Channel> removed;
    {
        std::unique_lock lock(channels_mutex_);
        const auto it = channels_.find(user_id);
        if (it == channels_.end()) return false;
        removed = std::move(it->second);
        channels_.erase(it);
    }
    std::lock_guard lock(removed->mutex);
    if (!removed->pending.empty()) {
        utils::log::info(std::format("Discarding {} pending events for user '{}'",
                                     removed->pending.size(), user_id));
    }
    return true;
}

size_t EventBridge::channel_count() const {
    std::shared_lock lock(channels_mutex_);
    return channels_.size();
}

// ============================================================================
// Typed notifications
// ============================================================================

DeliveryOutcome EventBridge::notify_agent_started(const std::string& user_id,
                                                  const std::optional<std::string>& thread_id,
                                                  const std::string& agent_name,
                                                  const nlohmann::json& context) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"status", "started"},
        {"context", sanitize::custom(context)}
    };
    return emit(user_id, Event::make(EventType::AGENT_STARTED, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_agent_thinking(const std::string& user_id,
                                                   const std::optional<std::string>& thread_id,
                                                   const std::string& agent_name,
                                                   const std::string& reasoning,
                                                   std::optional<int> step_number,
                                                   std::optional<double> progress_percentage) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"status", "thinking"},
        {"reasoning", utils::truncate(reasoning, sanitize::kMaxResultLength)}
    };
    if (step_number) payload["step_number"] = *step_number;
    if (progress_percentage) payload["progress_percentage"] = *progress_percentage;
    return emit(user_id, Event::make(EventType::AGENT_THINKING, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_tool_executing(const std::string& user_id,
                                                   const std::optional<std::string>& thread_id,
                                                   const std::string& agent_name,
                                                   const std::string& tool_name,
                                                   const nlohmann::json& parameters) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"tool_name", tool_name},
        {"status", "executing"},
        {"parameters", sanitize::parameters(parameters)}
    };
    return emit(user_id, Event::make(EventType::TOOL_EXECUTING, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_tool_completed(const std::string& user_id,
                                                   const std::optional<std::string>& thread_id,
                                                   const std::string& agent_name,
                                                   const std::string& tool_name,
                                                   const nlohmann::json& result,
                                                   std::optional<double> execution_time_ms) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"tool_name", tool_name},
        {"status", "completed"},
        {"result", sanitize::result(result)}
    };
    if (execution_time_ms) payload["execution_time_ms"] = *execution_time_ms;
    return emit(user_id, Event::make(EventType::TOOL_COMPLETED, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_agent_completed(const std::string& user_id,
                                                    const std::optional<std::string>& thread_id,
                                                    const std::string& agent_name,
                                                    const nlohmann::json& result,
                                                    std::optional<double> execution_time_ms) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"status", "completed"},
        {"result", sanitize::result(result)}
    };
    if (execution_time_ms) payload["execution_time_ms"] = *execution_time_ms;
    return emit(user_id, Event::make(EventType::AGENT_COMPLETED, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_agent_error(const std::string& user_id,
                                                const std::optional<std::string>& thread_id,
                                                const std::string& agent_name,
                                                const std::string& error_message,
                                                const nlohmann::json& error_context) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"status", "error"},
        {"error_message", sanitize::error_message(error_message)},
        {"error_context", sanitize::error_context(error_context)}
    };
    if (error_context.is_object() && error_context.value("degraded", false)) {
        payload["degraded"] = true;
    }
    return emit(user_id, Event::make(EventType::AGENT_ERROR, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_agent_death(const std::string& user_id,
                                                const std::optional<std::string>& thread_id,
                                                const std::string& agent_name,
                                                const std::string& death_cause) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"status", "dead"},
        {"death_cause", death_cause},
        {"message", sanitize::death_message(death_cause, agent_name)},
        {"recovery_action", "refresh_required"}
    };
    utils::log::error(std::format("Agent death: {} for user '{}' ({})", agent_name, user_id, death_cause));
    return emit(user_id, Event::make(EventType::AGENT_DEATH, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_progress_update(const std::string& user_id,
                                                    const std::optional<std::string>& thread_id,
                                                    const std::string& agent_name,
                                                    const nlohmann::json& progress) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"progress", sanitize::progress(progress)}
    };
    return emit(user_id, Event::make(EventType::PROGRESS_UPDATE, user_id, std::move(payload), thread_id));
}

DeliveryOutcome EventBridge::notify_custom(const std::string& user_id,
                                           const std::optional<std::string>& thread_id,
                                           const std::string& agent_name,
                                           const std::string& notification_type,
                                           const nlohmann::json& data) {
    nlohmann::json payload = {
        {"agent_name", agent_name},
        {"notification_type", notification_type},
        {"data", sanitize::custom(data)}
    };
    return emit(user_id, Event::make(EventType::CUSTOM, user_id, std::move(payload), thread_id));
}

} // namespace agentcore
