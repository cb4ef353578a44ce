#pragma once
#include "event.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentstream {

enum class ToolStatus { Pending, Running, Complete, Error };

inline const char* tool_status_name(ToolStatus status) {
    switch (status) {
        case ToolStatus::Pending: return "pending";
        case ToolStatus::Running: return "running";
        case ToolStatus::Complete: return "complete";
        case ToolStatus::Error: return "error";
    }
    return "pending";
}

// Accumulated record of one tool call across events.
// Identity is the tool-use id when the computation supplied one.
struct ToolInvocationEntry {
    std::string name;
    std::optional<std::string> id;
    Json input;                 // null until known
    bool input_is_json = false;
    Json result;                // null until known
    bool result_is_json = false;
    ToolStatus status = ToolStatus::Pending;

    // Null, blank string, or empty container.
    bool input_empty() const;
};

// Per-session mutable state. Written only on the consumer side by dispatch
// handlers and the assembler; the producer thread never touches it.
struct SessionState {
    std::string raw_text;      // every data chunk, unfiltered
    std::string filtered_text; // visible text emitted by the marker splitter
    std::optional<std::string> hidden_text;
    std::string reasoning_text; // reasoningText sub-stream
    std::optional<Json> final_result;
    std::optional<std::string> force_stop_error;
    std::vector<ToolInvocationEntry> tools; // first-sighting order

    void reset();

    // Entry registered under id, or nullptr.
    ToolInvocationEntry* find_tool(const std::string& id);

    // Append an entry, indexing it by id when present.
    ToolInvocationEntry& add_tool(ToolInvocationEntry entry);

    // Default display name for the next unnamed tool ("Tool 3").
    std::string next_tool_name() const;

private:
    std::unordered_map<std::string, size_t> tool_index_;
};

// Display form of a tool payload and whether it is structured JSON.
// Objects/arrays are structured; strings that parse as an object or array
// become structured; everything else is kept as-is.
std::pair<Json, bool> normalize_tool_value(const Json& value);

// Tool-use id from a payload ("toolUseId" or "tool_use_id"), if any.
std::optional<std::string> tool_use_id_of(const Json& payload);

} // namespace agentstream
