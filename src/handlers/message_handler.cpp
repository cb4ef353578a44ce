#include "message_handler.hpp"

#include <utility>

namespace agentstream {

MessageHandler::MessageHandler(SessionState& state, MarkerConfig markers)
    : state_(state), splitter_(std::move(markers)) {}

std::optional<Json> MessageHandler::handle(const Event& event) {
    std::optional<Json> output;

    if (const Json* data = event.find(event_keys::Data)) {
        handle_data(*data);
    }

    if (const Json* result = event.find(event_keys::Result)) {
        state_.final_result = *result;
        if (result->is_object()) {
            auto metrics = result->find("metrics");
            if (metrics != result->end() && is_truthy(*metrics)) {
                output = Json{{"metrics", *metrics}};
            }
        }
    }

    const Json* stop = event.find(event_keys::ForceStop);
    if (stop && is_truthy(*stop)) {
        std::string reason = event.string_or(event_keys::ForceStopReason, "Unknown error");
        state_.force_stop_error = "Error: " + reason;
    }

    return output;
}

void MessageHandler::handle_data(const Json& data) {
    if (!data.is_string()) return;
    const auto& chunk = data.get_ref<const std::string&>();
    if (chunk.empty()) return;

    state_.raw_text += chunk;
    state_.filtered_text += splitter_.feed(chunk);
    capture_hidden();
}

void MessageHandler::capture_hidden() {
    if (splitter_.hidden() && !state_.hidden_text) {
        state_.hidden_text = splitter_.hidden();
    }
}

void MessageHandler::reset() {
    splitter_.reset();
}

void MessageHandler::finish() {
    state_.filtered_text += splitter_.finish();
    capture_hidden();
}

} // namespace agentstream
