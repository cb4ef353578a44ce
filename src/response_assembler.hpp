#pragma once
#include "event_dispatcher.hpp"
#include "marker_splitter.hpp"
#include "session_state.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentstream {

// Final structured message of one session.
struct AssembledMessage {
    std::string text;
    std::optional<std::string> hidden_text;
    std::vector<ToolInvocationEntry> tools;
    bool force_stopped = false;
    std::vector<HandlerError> handler_errors;

    Json to_json() const;
};

// Folds dispatch outcomes of one session into an AssembledMessage.
// Reads and backfills the SessionState the handlers write; owns nothing.
class ResponseAssembler {
public:
    explicit ResponseAssembler(SessionState& state, MarkerConfig markers = {});

    // Fold the outcomes of one dispatch call.
    void absorb(const std::vector<HandlerOutcome>& outcomes);

    // Live view for renderers
    const std::string& partial_text() const { return state_.filtered_text; }
    const std::vector<ToolInvocationEntry>& tools() const { return state_.tools; }
    const std::vector<HandlerError>& handler_errors() const { return errors_; }

    AssembledMessage finalize() const;

    void reset();

private:
    void backfill(const Json& metrics);
    void backfill_one(const Json& metric);
    ToolInvocationEntry* match_by_name(const std::string& name);

    SessionState& state_;
    MarkerConfig markers_;
    std::vector<HandlerError> errors_;
};

// Visible text of a computation result: result.message as a string, its
// "content" string, or the first text block of its "content" array.
std::string extract_result_text(const Json& result);

// Removes every complete marker pair from a finished text. Returns the
// remaining text and the contents of the first pair, if any.
std::pair<std::string, std::optional<std::string>>
strip_marker_pairs(const std::string& text, const MarkerConfig& markers);

} // namespace agentstream
