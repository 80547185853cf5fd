#include "resilience/circuit_breaker.hpp"
#include "core/utils.hpp"

namespace agentcore {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config),
      state_word_(make_word(0, CircuitState::CLOSED)),
      consecutive_failures_(0),
      last_failure_time_(0),
      opened_wall_time_(0),
      opened_time_(0),
      last_transition_time_(0) {}

CallPermit CircuitBreaker::allow_request() {
    total_calls_.fetch_add(1, std::memory_order_relaxed);
    const uint64_t word = state_word_.load(std::memory_order_acquire);

    CallPermit permit;
    permit.generation = generation_of(word);

    switch (state_of(word)) {
        case CircuitState::CLOSED:
            permit.admitted = true;
            return permit;

        case CircuitState::OPEN: {
            const auto opened_time = SteadyTime(
                SteadyTime::duration(opened_time_.load(std::memory_order_acquire)));
            const auto elapsed = std::chrono::steady_clock::now() - opened_time;

            if (elapsed >= config_.open_duration && attempt_reset(word)) {
                // This caller carries the trial
                permit.admitted = true;
                permit.trial = true;
                return permit;
            }
            break;
        }

        case CircuitState::HALF_OPEN:
            // Trial already taken
            break;
    }

    rejected_calls_.fetch_add(1, std::memory_order_relaxed);
    return permit;
}

void CircuitBreaker::record_success(const CallPermit& permit) {
    if (!permit.admitted) {
        return;
    }
    if (permit.trial) {
        close_circuit(permit.generation);
    } else if (state_word_.load(std::memory_order_acquire) ==
               make_word(permit.generation, CircuitState::CLOSED)) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure(const CallPermit& permit) {
    if (!permit.admitted) {
        return;
    }

    failed_calls_.fetch_add(1, std::memory_order_relaxed);
    last_failure_time_.store(
        std::chrono::system_clock::now().time_since_epoch().count(),
        std::memory_order_release);

    if (permit.trial) {
        // Failed trial → back to OPEN
        trip(CircuitState::HALF_OPEN, permit.generation);
    } else {
        count_closed_failure(permit.generation);
    }
}

void CircuitBreaker::record_success() {
    if (state_of(state_word_.load(std::memory_order_acquire)) == CircuitState::CLOSED) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    failed_calls_.fetch_add(1, std::memory_order_relaxed);
    last_failure_time_.store(
        std::chrono::system_clock::now().time_since_epoch().count(),
        std::memory_order_release);
    count_closed_failure(generation_of(state_word_.load(std::memory_order_acquire)));
}

void CircuitBreaker::count_closed_failure(uint64_t generation) {
    // Outcomes from before the circuit last opened do not count
    if (state_word_.load(std::memory_order_acquire) != make_word(generation, CircuitState::CLOSED)) {
        return;
    }
    const uint32_t failures =
        consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (failures >= config_.failure_threshold) {
        trip(CircuitState::CLOSED, generation);
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_of(state_word_.load(std::memory_order_acquire));
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;

    stats.state = get_state();
    stats.consecutive_failures = consecutive_failures_.load(std::memory_order_relaxed);
    stats.total_calls = total_calls_.load(std::memory_order_relaxed);
    stats.failed_calls = failed_calls_.load(std::memory_order_relaxed);
    stats.rejected_calls = rejected_calls_.load(std::memory_order_relaxed);

    const auto last_failure_rep = last_failure_time_.load(std::memory_order_acquire);
    if (last_failure_rep > 0) {
        stats.last_failure = SystemTime(SystemTime::duration(last_failure_rep));
    }

    const auto opened_rep = opened_wall_time_.load(std::memory_order_acquire);
    if (opened_rep > 0) {
        stats.opened_at = SystemTime(SystemTime::duration(opened_rep));
    }

    const auto transition_rep = last_transition_time_.load(std::memory_order_acquire);
    if (transition_rep > 0) {
        stats.last_transition = SystemTime(SystemTime::duration(transition_rep));
    }

    return stats;
}

void CircuitBreaker::reset() {
    uint64_t word = state_word_.load(std::memory_order_acquire);
    while (!state_word_.compare_exchange_weak(
               word, make_word(generation_of(word) + 1, CircuitState::CLOSED),
               std::memory_order_acq_rel, std::memory_order_acquire)) {
    }
    consecutive_failures_.store(0, std::memory_order_relaxed);
    last_failure_time_.store(0, std::memory_order_relaxed);
    opened_wall_time_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);

    const CircuitState previous = state_of(word);
    if (previous != CircuitState::CLOSED) {
        emit_transition(previous, CircuitState::CLOSED);
    }
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

void CircuitBreaker::trip(CircuitState from, uint64_t generation) {
    // Stamped before OPEN is published so no caller reads a stale open time.
    // A lost CAS only means another transition won; its own stamp follows.
    opened_time_.store(std::chrono::steady_clock::now().time_since_epoch().count(),
                       std::memory_order_release);
    opened_wall_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                            std::memory_order_release);

    uint64_t expected = make_word(generation, from);
    if (state_word_.compare_exchange_strong(expected,
                                            make_word(generation + 1, CircuitState::OPEN),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
        emit_transition(from, CircuitState::OPEN);
    }
}

bool CircuitBreaker::attempt_reset(uint64_t observed) {
    // Only one caller can move this exact OPEN word to HALF_OPEN
    if (state_word_.compare_exchange_strong(observed,
                                            make_word(generation_of(observed), CircuitState::HALF_OPEN),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
        emit_transition(CircuitState::OPEN, CircuitState::HALF_OPEN);
        return true;
    }
    return false;
}

void CircuitBreaker::close_circuit(uint64_t generation) {
    uint64_t expected = make_word(generation, CircuitState::HALF_OPEN);
    if (state_word_.compare_exchange_strong(expected,
                                            make_word(generation, CircuitState::CLOSED),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

void CircuitBreaker::emit_transition(CircuitState from, CircuitState to) {
    const auto now = std::chrono::system_clock::now();
    last_transition_time_.store(now.time_since_epoch().count(), std::memory_order_release);

    StateChangeEvent event{from, to, now, name_};
    std::function<void(const StateChangeEvent&)> callback;
    {
        std::lock_guard lock(events_mutex_);
        recent_events_.push_back(event);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        callback = on_state_change_;
    }

    if (to == CircuitState::OPEN) {
        utils::log::warn(std::format("Circuit breaker '{}': {} -> OPEN",
                                     name_, circuit_state_to_string(from)));
    } else {
        utils::log::info(std::format("Circuit breaker '{}': {} -> {}",
                                     name_, circuit_state_to_string(from),
                                     circuit_state_to_string(to)));
    }

    if (callback) {
        callback(event);
    }
}

} // namespace agentcore
