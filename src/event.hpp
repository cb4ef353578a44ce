#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentstream {

// Event payloads keep insertion order so "first key" is well defined.
using Json = nlohmann::ordered_json;

// ── Event kinds ─────────────────────────────────────────────────

// Routing label derived from an event payload. Never persisted.
enum class EventKind {
    Data,
    CurrentToolUse,
    ToolResult,
    InitEventLoop,
    StartEventLoop,
    Start,
    Message,
    GenericEvent,
    Complete,
    Reasoning,
    ReasoningText,
    ReasoningSignature,
    RedactedContent,
    Result,
    ForceStop,
    Unknown
};

// Wire key for a kind ("data", "current_tool_use", ...; "unknown" for Unknown).
const char* kind_name(EventKind kind);

// Inverse of kind_name. Unrecognized keys map to EventKind::Unknown.
EventKind kind_from_key(const std::string& key);

// Lifecycle steps: init/start/message/generic event/complete.
bool is_lifecycle_kind(EventKind kind);

// Reasoning sub-stream kinds.
bool is_reasoning_kind(EventKind kind);

// Kinds that carry renderable content (text, tools, results, stops).
bool is_content_kind(EventKind kind);

// ── Event keys ──────────────────────────────────────────────────

namespace event_keys {
    constexpr const char* Data              = "data";
    constexpr const char* CurrentToolUse    = "current_tool_use";
    constexpr const char* ToolResult        = "tool_result";
    constexpr const char* InitEventLoop     = "init_event_loop";
    constexpr const char* StartEventLoop    = "start_event_loop";
    constexpr const char* Start             = "start";
    constexpr const char* Message           = "message";
    constexpr const char* GenericEvent      = "event";
    constexpr const char* Complete          = "complete";
    constexpr const char* Reasoning         = "reasoning";
    constexpr const char* ReasoningText     = "reasoningText";
    constexpr const char* ReasoningSignature = "reasoning_signature";
    constexpr const char* RedactedContent   = "redactedContent";
    constexpr const char* Result            = "result";
    constexpr const char* ForceStop         = "force_stop";
    constexpr const char* ForceStopReason   = "force_stop_reason";
} // namespace event_keys

// ── Event ───────────────────────────────────────────────────────

// Immutable key/value payload produced once by the computation callback.
// Handlers only read events; derived data goes into their return values.
class Event {
public:
    Event();
    explicit Event(Json payload);

    const Json& payload() const { return payload_; }

    bool empty() const { return payload_.empty(); }
    bool has(const std::string& key) const;

    // Value for key, or nullptr when absent.
    const Json* find(const std::string& key) const;

    // String value for key, or fallback when absent or not a string.
    std::string string_or(const std::string& key, const std::string& fallback) const;

    // Key names in insertion order.
    std::vector<std::string> keys() const;

    // First key in insertion order, or "unknown" for an empty event.
    std::string first_key() const;

    // True when the event ends a stream: contains a result or a truthy force_stop.
    bool is_terminal() const;

    static Event result(Json value);
    static Event force_stop(const std::string& reason);

private:
    Json payload_;
};

// Loose truthiness: null, false, 0, "" and empty containers are false.
bool is_truthy(const Json& value);

} // namespace agentstream
