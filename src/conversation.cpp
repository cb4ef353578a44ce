#include "conversation.hpp"
#include "handlers/message_handler.hpp"
#include "handlers/tool_handler.hpp"

#include <utility>

namespace agentstream {

Conversation::Conversation(std::shared_ptr<Computation> computation,
                           ConversationOptions options)
    : options_(std::move(options))
    , session_(std::move(computation), options_.stream)
    , assembler_(session_.state(), options_.marker)
    , debug_(dispatcher_.emplace<DebugHandler>(options_.debug_max_events,
                                               options_.debug_enabled))
{
    SessionState& state = session_.state();
    dispatcher_.emplace<MessageHandler>(state, options_.marker);
    dispatcher_.emplace<ToolHandler>(state);
    dispatcher_.emplace<ReasoningHandler>(state);
    dispatcher_.emplace<LifecycleHandler>();
    if (options_.log_events) {
        dispatcher_.emplace<LoggingHandler>(options_.log_stream ? *options_.log_stream
                                                                : std::cerr);
    }
}

EventHandler& Conversation::add_handler(std::unique_ptr<EventHandler> handler) {
    return dispatcher_.register_handler(std::move(handler));
}

AssembledMessage Conversation::send(const std::string& input,
                                    const ProgressCallback& on_progress) {
    dispatcher_.reset_handlers();
    assembler_.reset();
    session_.start(input);

    {
        EventStream stream = session_.events();
        for (const Event& event : stream) {
            std::vector<HandlerOutcome> outcomes = dispatcher_.dispatch(event);
            for (const auto& outcome : outcomes) {
                if (outcome.failed()) {
                    std::cerr << "[dispatch] " << outcome.error->handler << " error: "
                              << outcome.error->message << "\n";
                }
            }
            assembler_.absorb(outcomes);
            if (on_progress) on_progress(Progress{event, outcomes, assembler_});
        }
    }

    dispatcher_.finish_handlers();
    return assembler_.finalize();
}

} // namespace agentstream
