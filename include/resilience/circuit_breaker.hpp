#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentcore {

namespace detail {

template<typename F, bool = std::is_invocable_v<F&, const Deadline&>>
struct call_result {
    using type = std::invoke_result_t<F&, const Deadline&>;
};

template<typename F>
struct call_result<F, false> {
    using type = std::invoke_result_t<F&>;
};

} // namespace detail

template<typename F>
using call_result_t = typename detail::call_result<std::remove_cvref_t<F>>::type;

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    SystemTime timestamp;
    std::string breaker_name;
};

/**
 * @brief Admission ticket returned by CircuitBreaker::allow_request()
 */
struct CallPermit {
    bool admitted = false;
    bool trial = false;          // Carries the HALF_OPEN decision
    uint64_t generation = 0;     // Breaker generation at admission

    explicit operator bool() const { return admitted; }
};

/**
 * @brief Circuit Breaker guarding one external dependency
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately (no call attempted)
 * - HALF_OPEN:  Exactly one trial call in flight
 *
 * State transitions:
 * - CLOSED → OPEN:      consecutive failures >= failure_threshold
 * - OPEN → HALF_OPEN:   open_duration elapsed (first caller wins the trial)
 * - HALF_OPEN → CLOSED: trial call succeeded (failure counter reset)
 * - HALF_OPEN → OPEN:   trial call failed (open timer restarted)
 *
 * Every admission hands out a CallPermit. Only the trial permit settles
 * HALF_OPEN; outcomes of permits issued before the circuit last opened
 * are ignored.
 *
 * Performance: ~50ns to check state (atomic load)
 */
class CircuitBreaker {
public:
    /**
     * @brief Configuration
     */
    struct Config {
        uint32_t failure_threshold;             // Consecutive failures to trip OPEN
        std::chrono::milliseconds open_duration; // Time before trying HALF_OPEN
        std::chrono::milliseconds call_timeout;  // Per-call budget

        Config()
            : failure_threshold(3),
              open_duration(30000),
              call_timeout(5000) {}
    };

    /**
     * @brief Construct circuit breaker
     * @param name Dependency name (e.g. "database", "llm")
     * @param config Configuration
     */
    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Check if request can proceed
     *
     * In OPEN state, transitions to HALF_OPEN once open_duration elapsed and
     * admits the caller as the single trial call.
     *
     * @return permit; converts to false if rejected
     */
    [[nodiscard]] CallPermit allow_request();

    /**
     * @brief Record the outcome of an admitted call
     *
     * A trial permit moves HALF_OPEN to CLOSED (success) or back to OPEN
     * (failure). Any other permit only counts while the circuit is CLOSED
     * in the generation it was issued in.
     */
    void record_success(const CallPermit& permit);
    void record_failure(const CallPermit& permit);

    /**
     * @brief Record an outcome observed outside a permitted call
     *
     * Counts toward the failure threshold while CLOSED; never settles a
     * HALF_OPEN trial.
     */
    void record_success();
    void record_failure();

    /**
     * @brief Run an operation through the breaker
     *
     * The operation runs on its own thread and is invoked either as op() or
     * op(const Deadline&). The caller waits at most call_timeout; past that
     * the call is a counted failure and the late result is discarded. The
     * operation keeps running detached, so it must own what it captures
     * (or stop at the deadline it is given).
     *
     * @return ok(value), or error(CIRCUIT_OPEN) when rejected, or
     *         error(SERVICE_UNAVAILABLE) when the operation threw or timed out
     */
    template<typename F>
    Result<call_result_t<F>> call(F&& op);

    /**
     * @brief Run an operation, substituting fallback() on rejection or failure
     * @return ok(value) or degraded(fallback value) carrying the reason
     */
    template<typename F, typename Fallback>
    Result<call_result_t<F>> call_with_fallback(F&& op, Fallback&& fallback);

    /**
     * @brief Get current state
     */
    CircuitState get_state() const;

    /**
     * @brief Get statistics
     */
    CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    /**
     * @brief Get circuit breaker name
     */
    const std::string& name() const { return name_; }

    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions
     *
     * Invoked on the thread that caused the transition, outside internal locks.
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    // State and generation share one word so every transition is a single CAS.
    // The generation advances each time the circuit opens or is reset.
    static constexpr uint64_t kStateMask = 0x3;

    static CircuitState state_of(uint64_t word) {
        return static_cast<CircuitState>(word & kStateMask);
    }
    static uint64_t generation_of(uint64_t word) { return word >> 2; }
    static uint64_t make_word(uint64_t generation, CircuitState state) {
        return (generation << 2) | static_cast<uint64_t>(state);
    }

    /**
     * @brief Transition from → OPEN (from is CLOSED or HALF_OPEN)
     */
    void trip(CircuitState from, uint64_t generation);

    void count_closed_failure(uint64_t generation);

    /**
     * @brief Transition OPEN → HALF_OPEN; true if this caller won the trial
     */
    bool attempt_reset(uint64_t observed);

    /**
     * @brief Transition HALF_OPEN → CLOSED
     */
    void close_circuit(uint64_t generation);

    void emit_transition(CircuitState from, CircuitState to);

    std::string name_;
    Config config_;

    // Atomic state
    std::atomic<uint64_t> state_word_;
    std::atomic<uint32_t> consecutive_failures_;

    // Counters
    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> failed_calls_{0};
    std::atomic<uint64_t> rejected_calls_{0};

    // Timestamps
    std::atomic<SystemTime::rep> last_failure_time_;
    std::atomic<SystemTime::rep> opened_wall_time_;
    std::atomic<SteadyTime::rep> opened_time_;
    std::atomic<SystemTime::rep> last_transition_time_;

    // State change events
    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename F>
Result<call_result_t<F>> CircuitBreaker::call(F&& op) {
    using R = call_result_t<F>;
    static_assert(!std::is_void_v<R>, "CircuitBreaker::call requires a value-returning operation");

    const CallPermit permit = allow_request();
    if (!permit) {
        return Result<R>::error(ErrorCategory::CIRCUIT_OPEN,
            std::format("Circuit breaker '{}' is open", name_));
    }

    const Deadline deadline = std::chrono::steady_clock::now() + config_.call_timeout;
    try {
        std::packaged_task<R()> task([fn = std::forward<F>(op), deadline]() mutable -> R {
            if constexpr (std::is_invocable_v<decltype(fn)&, const Deadline&>) {
                return fn(deadline);
            } else {
                return fn();
            }
        });
        auto future = task.get_future();
        std::thread(std::move(task)).detach();

        if (future.wait_until(deadline) == std::future_status::timeout) {
            record_failure(permit);
            return Result<R>::error(ErrorCategory::SERVICE_UNAVAILABLE,
                std::format("'{}' call exceeded timeout of {}ms",
                            name_, config_.call_timeout.count()));
        }

        R value = future.get();
        record_success(permit);
        return Result<R>::ok(std::move(value));
    } catch (const std::exception& e) {
        record_failure(permit);
        return Result<R>::error(ErrorCategory::SERVICE_UNAVAILABLE,
            std::format("'{}' call failed: {}", name_, e.what()));
    } catch (...) {
        // Not ours to translate; the failure still counts
        record_failure(permit);
        throw;
    }
}

template<typename F, typename Fallback>
Result<call_result_t<F>> CircuitBreaker::call_with_fallback(F&& op, Fallback&& fallback) {
    using R = call_result_t<F>;
    auto result = call(std::forward<F>(op));
    if (result.is_ok()) {
        return result;
    }
    return Result<R>::degraded(static_cast<R>(fallback()),
                               result.error_category(), result.error_message());
}

} // namespace agentcore
