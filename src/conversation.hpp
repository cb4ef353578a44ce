#pragma once
#include "event_dispatcher.hpp"
#include "handlers/lifecycle_handlers.hpp"
#include "response_assembler.hpp"
#include "stream_session.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace agentstream {

struct ConversationOptions {
    StreamConfig stream;
    MarkerConfig marker;
    size_t debug_max_events = 100;
    bool debug_enabled = false;
    bool log_events = false;
    std::ostream* log_stream = &std::cerr; // LoggingHandler target
};

// Live view handed to the progress callback after each dispatched event.
struct Progress {
    const Event& event;
    const std::vector<HandlerOutcome>& outcomes;
    const ResponseAssembler& assembler;
};

using ProgressCallback = std::function<void(const Progress& progress)>;

// One computation driven through the event pipeline, turn after turn:
// StreamSession -> EventDispatcher (default handlers) -> ResponseAssembler.
class Conversation {
public:
    explicit Conversation(std::shared_ptr<Computation> computation,
                          ConversationOptions options = {});

    // Run one turn to completion and return its assembled message.
    AssembledMessage send(const std::string& input,
                          const ProgressCallback& on_progress = nullptr);

    void set_debug(bool enabled) { debug_.set_enabled(enabled); }
    const DebugHandler& debug() const { return debug_; }
    void clear_debug() { debug_.clear(); }

    // Extra handlers join the default set in priority order.
    EventHandler& add_handler(std::unique_ptr<EventHandler> handler);

    const StreamSession& session() const { return session_; }
    const EventDispatcher& dispatcher() const { return dispatcher_; }

private:
    ConversationOptions options_;
    StreamSession session_;
    EventDispatcher dispatcher_;
    ResponseAssembler assembler_;
    DebugHandler& debug_;
};

} // namespace agentstream
