#pragma once
#include "../event_dispatcher.hpp"
#include "../marker_splitter.hpp"
#include "../session_state.hpp"

namespace agentstream {

// Streams text chunks through the marker splitter and records the final
// result or forced stop. Reports tool metrics from the final result as
// {"metrics": ...} so the assembler can backfill tool inputs.
class MessageHandler : public EventHandler {
public:
    explicit MessageHandler(SessionState& state, MarkerConfig markers = {});

    bool can_handle(EventKind kind) const override { return is_content_kind(kind); }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 10; }
    std::string handler_name() const override { return "MessageHandler"; }

    void reset() override;
    void finish() override;

private:
    void handle_data(const Json& data);
    void capture_hidden();

    SessionState& state_;
    MarkerSplitter splitter_;
};

} // namespace agentstream
