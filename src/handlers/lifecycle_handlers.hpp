#pragma once
#include "../event_dispatcher.hpp"
#include "../session_state.hpp"
#include <cstddef>
#include <deque>
#include <iostream>

namespace agentstream {

// Acknowledges lifecycle steps (init, start, message, event, complete).
class LifecycleHandler : public EventHandler {
public:
    bool can_handle(EventKind kind) const override { return is_lifecycle_kind(kind); }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 50; }
    std::string handler_name() const override { return "LifecycleHandler"; }
};

// Accumulates the reasoningText sub-stream.
class ReasoningHandler : public EventHandler {
public:
    explicit ReasoningHandler(SessionState& state) : state_(state) {}

    bool can_handle(EventKind kind) const override { return is_reasoning_kind(kind); }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 30; }
    std::string handler_name() const override { return "ReasoningHandler"; }

private:
    SessionState& state_;
};

// Writes one line per event. Sees every event, contributes no outcome.
class LoggingHandler : public EventHandler {
public:
    explicit LoggingHandler(std::ostream& out = std::cerr) : out_(out) {}

    bool can_handle(EventKind) const override { return true; }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 80; }
    std::string handler_name() const override { return "LoggingHandler"; }

private:
    std::ostream& out_;
};

// Keeps the most recent events while enabled.
class DebugHandler : public EventHandler {
public:
    struct Entry {
        std::string event_type;
        Json event_data;
    };

    explicit DebugHandler(size_t max_events = 100, bool enabled = false)
        : max_events_(max_events), enabled_(enabled) {}

    bool can_handle(EventKind) const override { return enabled_; }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 95; }
    std::string handler_name() const override { return "DebugHandler"; }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    const std::deque<Entry>& events() const { return log_; }
    void clear() { log_.clear(); }

private:
    size_t max_events_;
    bool enabled_;
    std::deque<Entry> log_;
};

} // namespace agentstream
