#include "event.hpp"

#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace agentstream {

const char* kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Data:               return event_keys::Data;
        case EventKind::CurrentToolUse:     return event_keys::CurrentToolUse;
        case EventKind::ToolResult:         return event_keys::ToolResult;
        case EventKind::InitEventLoop:      return event_keys::InitEventLoop;
        case EventKind::StartEventLoop:     return event_keys::StartEventLoop;
        case EventKind::Start:              return event_keys::Start;
        case EventKind::Message:            return event_keys::Message;
        case EventKind::GenericEvent:       return event_keys::GenericEvent;
        case EventKind::Complete:           return event_keys::Complete;
        case EventKind::Reasoning:          return event_keys::Reasoning;
        case EventKind::ReasoningText:      return event_keys::ReasoningText;
        case EventKind::ReasoningSignature: return event_keys::ReasoningSignature;
        case EventKind::RedactedContent:    return event_keys::RedactedContent;
        case EventKind::Result:             return event_keys::Result;
        case EventKind::ForceStop:          return event_keys::ForceStop;
        case EventKind::Unknown:            break;
    }
    return "unknown";
}

EventKind kind_from_key(const std::string& key) {
    static const std::unordered_map<std::string, EventKind> kinds = {
        {event_keys::Data, EventKind::Data},
        {event_keys::CurrentToolUse, EventKind::CurrentToolUse},
        {event_keys::ToolResult, EventKind::ToolResult},
        {event_keys::InitEventLoop, EventKind::InitEventLoop},
        {event_keys::StartEventLoop, EventKind::StartEventLoop},
        {event_keys::Start, EventKind::Start},
        {event_keys::Message, EventKind::Message},
        {event_keys::GenericEvent, EventKind::GenericEvent},
        {event_keys::Complete, EventKind::Complete},
        {event_keys::Reasoning, EventKind::Reasoning},
        {event_keys::ReasoningText, EventKind::ReasoningText},
        {event_keys::ReasoningSignature, EventKind::ReasoningSignature},
        {event_keys::RedactedContent, EventKind::RedactedContent},
        {event_keys::Result, EventKind::Result},
        {event_keys::ForceStop, EventKind::ForceStop},
    };
    auto it = kinds.find(key);
    if (it == kinds.end()) return EventKind::Unknown;
    return it->second;
}

bool is_lifecycle_kind(EventKind kind) {
    switch (kind) {
        case EventKind::InitEventLoop:
        case EventKind::StartEventLoop:
        case EventKind::Start:
        case EventKind::Message:
        case EventKind::GenericEvent:
        case EventKind::Complete:
            return true;
        default:
            return false;
    }
}

bool is_reasoning_kind(EventKind kind) {
    switch (kind) {
        case EventKind::Reasoning:
        case EventKind::ReasoningText:
        case EventKind::ReasoningSignature:
        case EventKind::RedactedContent:
            return true;
        default:
            return false;
    }
}

bool is_content_kind(EventKind kind) {
    switch (kind) {
        case EventKind::Data:
        case EventKind::CurrentToolUse:
        case EventKind::ToolResult:
        case EventKind::ReasoningText:
        case EventKind::Result:
        case EventKind::ForceStop:
        case EventKind::GenericEvent:
            return true;
        default:
            return false;
    }
}

// ── Event ───────────────────────────────────────────────────────

Event::Event() : payload_(Json::object()) {}

Event::Event(Json payload) : payload_(std::move(payload)) {
    if (!payload_.is_object()) {
        throw std::invalid_argument("Event payload must be a JSON object");
    }
}

bool Event::has(const std::string& key) const {
    return payload_.contains(key);
}

const Json* Event::find(const std::string& key) const {
    auto it = payload_.find(key);
    if (it == payload_.end()) return nullptr;
    return &(*it);
}

std::string Event::string_or(const std::string& key, const std::string& fallback) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return fallback;
    return v->get<std::string>();
}

std::vector<std::string> Event::keys() const {
    std::vector<std::string> out;
    out.reserve(payload_.size());
    for (auto it = payload_.begin(); it != payload_.end(); ++it) {
        out.push_back(it.key());
    }
    return out;
}

std::string Event::first_key() const {
    if (payload_.empty()) return "unknown";
    return payload_.begin().key();
}

bool Event::is_terminal() const {
    if (has(event_keys::Result)) return true;
    const Json* stop = find(event_keys::ForceStop);
    return stop && is_truthy(*stop);
}

Event Event::result(Json value) {
    Json payload = Json::object();
    payload[event_keys::Result] = std::move(value);
    return Event(std::move(payload));
}

Event Event::force_stop(const std::string& reason) {
    Json payload = Json::object();
    payload[event_keys::ForceStop] = true;
    payload[event_keys::ForceStopReason] = reason;
    return Event(std::move(payload));
}

bool is_truthy(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return false;
        case Json::value_t::boolean:
            return value.get<bool>();
        case Json::value_t::number_integer:
            return value.get<int64_t>() != 0;
        case Json::value_t::number_unsigned:
            return value.get<uint64_t>() != 0;
        case Json::value_t::number_float:
            return value.get<double>() != 0.0;
        case Json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case Json::value_t::array:
        case Json::value_t::object:
        case Json::value_t::binary:
            return !value.empty();
    }
    return false;
}

} // namespace agentstream
