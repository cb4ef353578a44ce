#pragma once
#include "../event_dispatcher.hpp"
#include "../session_state.hpp"

namespace agentstream {

// Tracks tool invocations and their results in SessionState.
// Returns {"tool_update": {"id", "name", "status"}} whenever an entry changes.
class ToolHandler : public EventHandler {
public:
    explicit ToolHandler(SessionState& state) : state_(state) {}

    bool can_handle(EventKind kind) const override { return is_content_kind(kind); }
    std::optional<Json> handle(const Event& event) override;
    int priority() const override { return 20; }
    std::string handler_name() const override { return "ToolHandler"; }

    // Entries still open at stream end become complete (unless stopped).
    void finish() override;

private:
    ToolInvocationEntry& on_tool_use(const Json& tool);
    ToolInvocationEntry& on_tool_result(const Json& payload);
    void mark_force_stop();

    SessionState& state_;
};

} // namespace agentstream
