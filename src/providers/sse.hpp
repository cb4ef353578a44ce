#pragma once
#include <functional>
#include <string>

namespace agentstream {

struct SSEEvent {
    std::string event; // event type (e.g., "message_start", "content_block_delta")
    std::string data;  // raw JSON data, multi-line data joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental Server-Sent Events parser. Lines, fields and events may be
// split across any number of feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    void reset();

private:
    void parse_line(const std::string& line);

    std::string buffer_;     // incomplete trailing line
    std::string event_;      // fields of the event being built
    std::string data_;
    bool has_data_ = false;
};

} // namespace agentstream
