#pragma once

#include "events/event.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <utility>

namespace agentcore {

/**
 * @brief Abstract interface for one user's live connection
 *
 * The EventBridge calls send() while holding that user's channel lock, so
 * implementations see calls for one user serialized. They must honour the
 * timeout and return false instead of blocking past it.
 */
class IEventTransport {
public:
    virtual ~IEventTransport() = default;

    /// Deliver one event. Returns true on success, false on failure or timeout.
    [[nodiscard]] virtual bool send(const Event& event, std::chrono::milliseconds timeout) = 0;

    /// Human-readable transport name for logging (e.g. "ws:conn-42")
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Transport that hands serialized events to a callback
 *
 * Adapts any sink (socket writer, log line, test capture) that takes JSON text.
 */
class CallbackTransport : public IEventTransport {
public:
    using SendFn = std::function<bool(const std::string& json, std::chrono::milliseconds timeout)>;

    CallbackTransport(std::string name, SendFn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    [[nodiscard]] bool send(const Event& event, std::chrono::milliseconds timeout) override {
        return fn_(event.serialize(), timeout);
    }

    [[nodiscard]] std::string name() const override { return name_; }

private:
    std::string name_;
    SendFn fn_;
};

} // namespace agentcore
