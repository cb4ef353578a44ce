#pragma once
#include "event.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentstream {

// A unit of event processing. Lower priority runs first.
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual bool can_handle(EventKind kind) const = 0;

    // Process an accepted event; return structured data or nothing.
    virtual std::optional<Json> handle(const Event& event) = 0;

    virtual int priority() const { return 100; }
    virtual std::string handler_name() const = 0;

    // Called before each new stream.
    virtual void reset() {}

    // Called once after the last event of a stream.
    virtual void finish() {}
};

struct HandlerError {
    std::string handler;
    std::string error_type;
    std::string message;
    EventKind event_kind = EventKind::Unknown;
};

// One entry of a dispatch result: either a handler's output or its failure.
struct HandlerOutcome {
    std::string handler;
    Json output;
    std::optional<HandlerError> error;

    bool failed() const { return error.has_value(); }

    // {"handler_error": {...}} for failures, the output otherwise.
    Json to_json() const;
};

// Routes events to every interested handler in priority order.
// Handler failures are captured as outcomes; dispatch never throws on their behalf.
class EventDispatcher {
public:
    // Register using the handler's own priority.
    EventHandler& register_handler(std::unique_ptr<EventHandler> handler);

    // Register with an explicit priority. Ties keep registration order.
    EventHandler& register_handler(std::unique_ptr<EventHandler> handler, int priority);

    template<typename H, typename... Args>
    H& emplace(Args&&... args) {
        auto handler = std::make_unique<H>(std::forward<Args>(args)...);
        H& ref = *handler;
        register_handler(std::move(handler));
        return ref;
    }

    // Deterministic, total classification of an event payload.
    static EventKind classify(const Event& event);

    std::vector<HandlerOutcome> dispatch(const Event& event);

    // Handlers accepting kind, in dispatch order.
    std::vector<EventHandler*> handlers_for(EventKind kind) const;

    void reset_handlers();
    void finish_handlers();

    size_t size() const { return registrations_.size(); }

private:
    struct Registration {
        std::unique_ptr<EventHandler> handler;
        int priority;
    };

    std::vector<Registration> registrations_;
};

} // namespace agentstream
