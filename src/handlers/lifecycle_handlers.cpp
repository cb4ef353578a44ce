#include "lifecycle_handlers.hpp"

namespace agentstream {

std::optional<Json> LifecycleHandler::handle(const Event& event) {
    return Json{{"lifecycle_processed", event.first_key()}};
}

std::optional<Json> ReasoningHandler::handle(const Event& event) {
    if (const Json* text = event.find(event_keys::ReasoningText)) {
        if (text->is_string()) state_.reasoning_text += text->get<std::string>();
    }
    return Json{{"reasoning_processed", event.first_key()}};
}

std::optional<Json> LoggingHandler::handle(const Event& event) {
    out_ << "[event] " << kind_name(EventDispatcher::classify(event)) << " keys=[";
    bool first = true;
    for (const auto& key : event.keys()) {
        if (!first) out_ << ", ";
        out_ << key;
        first = false;
    }
    out_ << "]";

    if (const Json* data = event.find(event_keys::Data)) {
        if (data->is_string()) out_ << " chars=" << data->get_ref<const std::string&>().size();
    }
    if (const Json* reason = event.find(event_keys::ForceStopReason)) {
        out_ << " reason=" << reason->dump();
    }
    out_ << "\n";
    return std::nullopt;
}

std::optional<Json> DebugHandler::handle(const Event& event) {
    if (!enabled_) return std::nullopt;

    log_.push_back(Entry{event.first_key(), event.payload()});
    while (log_.size() > max_events_) {
        log_.pop_front();
    }
    return std::nullopt;
}

} // namespace agentstream
