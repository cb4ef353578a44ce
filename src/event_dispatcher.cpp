#include "event_dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace agentstream {

Json HandlerOutcome::to_json() const {
    if (!error) return output;
    return Json{{"handler_error", {
        {"handler", error->handler},
        {"error_type", error->error_type},
        {"error_message", error->message},
        {"event_type", kind_name(error->event_kind)}
    }}};
}

EventHandler& EventDispatcher::register_handler(std::unique_ptr<EventHandler> handler) {
    if (!handler) throw std::invalid_argument("Cannot register a null handler");
    int priority = handler->priority();
    return register_handler(std::move(handler), priority);
}

EventHandler& EventDispatcher::register_handler(std::unique_ptr<EventHandler> handler,
                                                int priority) {
    if (!handler) throw std::invalid_argument("Cannot register a null handler");
    EventHandler& ref = *handler;
    registrations_.push_back(Registration{std::move(handler), priority});
    std::stable_sort(registrations_.begin(), registrations_.end(),
        [](const Registration& a, const Registration& b) {
            return a.priority < b.priority;
        });
    return ref;
}

EventKind EventDispatcher::classify(const Event& event) {
    // Well-known keys win over payload order
    static const EventKind priority_kinds[] = {
        EventKind::Data,
        EventKind::CurrentToolUse,
        EventKind::ToolResult,
        EventKind::ReasoningText,
        EventKind::Result,
        EventKind::ForceStop,
    };
    for (EventKind kind : priority_kinds) {
        if (event.has(kind_name(kind))) return kind;
    }
    if (event.empty()) return EventKind::Unknown;
    return kind_from_key(event.first_key());
}

std::vector<HandlerOutcome> EventDispatcher::dispatch(const Event& event) {
    std::vector<HandlerOutcome> outcomes;
    const EventKind kind = classify(event);

    for (auto& reg : registrations_) {
        EventHandler& handler = *reg.handler;

        auto fail = [&](const char* error_type, const std::string& message) {
            HandlerOutcome outcome;
            outcome.handler = handler.handler_name();
            outcome.error = HandlerError{handler.handler_name(), error_type, message, kind};
            outcomes.push_back(std::move(outcome));
        };

        try {
            if (!handler.can_handle(kind)) continue;
            auto result = handler.handle(event);
            if (result && !result->is_null() && !result->empty()) {
                outcomes.push_back(HandlerOutcome{handler.handler_name(), std::move(*result), {}});
            }
        } catch (const nlohmann::json::exception& e) {
            fail("json_error", e.what());
        } catch (const std::invalid_argument& e) {
            fail("invalid_argument", e.what());
        } catch (const std::out_of_range& e) {
            fail("out_of_range", e.what());
        } catch (const std::logic_error& e) {
            fail("logic_error", e.what());
        } catch (const std::runtime_error& e) {
            fail("runtime_error", e.what());
        } catch (const std::exception& e) {
            fail("exception", e.what());
        } catch (...) {
            fail("unknown", "non-standard exception");
        }
    }

    return outcomes;
}

std::vector<EventHandler*> EventDispatcher::handlers_for(EventKind kind) const {
    std::vector<EventHandler*> out;
    for (const auto& reg : registrations_) {
        if (reg.handler->can_handle(kind)) out.push_back(reg.handler.get());
    }
    return out;
}

void EventDispatcher::reset_handlers() {
    for (auto& reg : registrations_) {
        reg.handler->reset();
    }
}

void EventDispatcher::finish_handlers() {
    for (auto& reg : registrations_) {
        try {
            reg.handler->finish();
        } catch (const std::exception& e) {
            std::cerr << "[dispatch] " << reg.handler->handler_name()
                      << " failed to finish: " << e.what() << "\n";
        }
    }
}

} // namespace agentstream
