#include "response_assembler.hpp"
#include "util.hpp"

#include <iostream>
#include <utility>

namespace agentstream {

static const char* const NO_RESPONSE = "[No response]";

Json AssembledMessage::to_json() const {
    Json tool_list = Json::array();
    for (const auto& entry : tools) {
        tool_list.push_back({
            {"name", entry.name},
            {"id", entry.id ? Json(*entry.id) : Json()},
            {"input", entry.input},
            {"input_is_json", entry.input_is_json},
            {"result", entry.result},
            {"result_is_json", entry.result_is_json},
            {"status", tool_status_name(entry.status)}
        });
    }

    Json out = {
        {"text", text},
        {"hidden_text", hidden_text ? Json(*hidden_text) : Json()},
        {"tools", tool_list},
        {"force_stopped", force_stopped}
    };
    if (!handler_errors.empty()) {
        Json errs = Json::array();
        for (const auto& err : handler_errors) {
            errs.push_back({{"handler", err.handler},
                            {"error_type", err.error_type},
                            {"error_message", err.message},
                            {"event_type", kind_name(err.event_kind)}});
        }
        out["handler_errors"] = errs;
    }
    return out;
}

std::string extract_result_text(const Json& result) {
    if (!result.is_object()) return "";
    auto msg = result.find("message");
    if (msg == result.end()) return "";
    if (msg->is_string()) return msg->get<std::string>();
    if (!msg->is_object()) return "";

    auto content = msg->find("content");
    if (content == msg->end()) return "";
    if (content->is_string()) return content->get<std::string>();
    if (content->is_array()) {
        for (const auto& block : *content) {
            if (block.is_object() && block.contains("text") && block.at("text").is_string()) {
                return block.at("text").get<std::string>();
            }
        }
    }
    return "";
}

std::pair<std::string, std::optional<std::string>>
strip_marker_pairs(const std::string& text, const MarkerConfig& markers) {
    std::string visible;
    std::optional<std::string> hidden;
    size_t pos = 0;
    while (true) {
        size_t start = text.find(markers.open, pos);
        if (start == std::string::npos) break;
        size_t end = text.find(markers.close, start + markers.open.size());
        if (end == std::string::npos) break;
        visible += text.substr(pos, start - pos);
        if (!hidden) hidden = text.substr(start + markers.open.size(), end - start - markers.open.size());
        pos = end + markers.close.size();
    }
    visible += text.substr(pos);
    return {visible, hidden};
}

ResponseAssembler::ResponseAssembler(SessionState& state, MarkerConfig markers)
    : state_(state), markers_(std::move(markers)) {}

void ResponseAssembler::reset() {
    errors_.clear();
}

void ResponseAssembler::absorb(const std::vector<HandlerOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (outcome.failed()) {
            errors_.push_back(*outcome.error);
            continue;
        }
        if (outcome.output.is_object() && outcome.output.contains("metrics")) {
            backfill(outcome.output.at("metrics"));
        }
    }
}

// ── Metrics backfill ────────────────────────────────────────────

void ResponseAssembler::backfill(const Json& metrics) {
    if (!metrics.is_object()) return;
    auto tool_metrics = metrics.find("tool_metrics");
    if (tool_metrics == metrics.end()) return;

    if (tool_metrics->is_object() || tool_metrics->is_array()) {
        for (const auto& metric : *tool_metrics) {
            backfill_one(metric);
        }
    }
}

void ResponseAssembler::backfill_one(const Json& metric) {
    if (!metric.is_object()) return;
    auto tool_it = metric.find("tool");
    if (tool_it == metric.end() || !tool_it->is_object()) return;
    const Json& tool = *tool_it;

    auto input_it = tool.find("input");
    if (input_it == tool.end() || input_it->is_null()) return;

    std::string name;
    auto name_it = tool.find("name");
    if (name_it != tool.end() && name_it->is_string()) name = name_it->get<std::string>();

    ToolInvocationEntry* entry = nullptr;
    auto id = tool_use_id_of(tool);
    if (id) {
        entry = state_.find_tool(*id);
        if (!entry) {
            ToolInvocationEntry fresh;
            fresh.name = name.empty() ? state_.next_tool_name() : name;
            fresh.id = id;
            fresh.status = ToolStatus::Complete;
            entry = &state_.add_tool(std::move(fresh));
        }
    } else if (!name.empty()) {
        entry = match_by_name(name);
    }

    // Populated inputs are never overwritten
    if (!entry || !entry->input_empty()) return;

    auto [value, is_json] = normalize_tool_value(*input_it);
    entry->input = std::move(value);
    entry->input_is_json = is_json;
}

ToolInvocationEntry* ResponseAssembler::match_by_name(const std::string& name) {
    // Only an unambiguous match is filled; two empty entries of one name are skipped.
    ToolInvocationEntry* match = nullptr;
    for (auto& entry : state_.tools) {
        if (entry.name != name || !entry.input_empty()) continue;
        if (match) {
            std::cerr << "[assembler] Ambiguous metrics for tool '" << name
                      << "', input not backfilled\n";
            return nullptr;
        }
        match = &entry;
    }
    return match;
}

// ── Finalize ────────────────────────────────────────────────────

AssembledMessage ResponseAssembler::finalize() const {
    AssembledMessage msg;
    msg.tools = state_.tools;
    msg.handler_errors = errors_;

    if (state_.force_stop_error) {
        msg.text = *state_.force_stop_error;
        msg.force_stopped = true;
        return msg;
    }

    std::string visible = state_.filtered_text;
    std::optional<std::string> hidden = state_.hidden_text;

    if (state_.raw_text.empty() && state_.final_result) {
        auto stripped = strip_marker_pairs(extract_result_text(*state_.final_result), markers_);
        visible = std::move(stripped.first);
        if (!hidden) hidden = std::move(stripped.second);
    }

    msg.text = trim(visible);
    if (msg.text.empty()) msg.text = NO_RESPONSE;

    if (!hidden && !trim(state_.reasoning_text).empty()) {
        hidden = state_.reasoning_text;
    }
    msg.hidden_text = std::move(hidden);
    return msg;
}

} // namespace agentstream
