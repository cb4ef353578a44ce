#include "tool_handler.hpp"

#include <utility>

namespace agentstream {

static Json tool_update(const ToolInvocationEntry& entry) {
    return Json{{"tool_update", {
        {"id", entry.id ? Json(*entry.id) : Json()},
        {"name", entry.name},
        {"status", tool_status_name(entry.status)}
    }}};
}

std::optional<Json> ToolHandler::handle(const Event& event) {
    std::optional<Json> output;

    if (const Json* tool = event.find(event_keys::CurrentToolUse)) {
        if (tool->is_object()) {
            output = tool_update(on_tool_use(*tool));
        }
    }

    if (const Json* result = event.find(event_keys::ToolResult)) {
        output = tool_update(on_tool_result(*result));
    }

    const Json* stop = event.find(event_keys::ForceStop);
    if (stop && is_truthy(*stop)) {
        mark_force_stop();
    }

    return output;
}

ToolInvocationEntry& ToolHandler::on_tool_use(const Json& tool) {
    auto id = tool_use_id_of(tool);
    std::string name;
    auto name_it = tool.find("name");
    if (name_it != tool.end() && name_it->is_string()) name = name_it->get<std::string>();

    ToolInvocationEntry* entry = nullptr;
    if (id) {
        entry = state_.find_tool(*id);
    } else if (!state_.tools.empty()) {
        // Without an id, repeated sightings refer to the latest id-less entry of that name
        auto& last = state_.tools.back();
        if (!last.id && (name.empty() || last.name == name)) entry = &last;
    }

    if (!entry) {
        ToolInvocationEntry fresh;
        fresh.name = name.empty() ? state_.next_tool_name() : name;
        fresh.id = id;
        auto input_it = tool.find("input");
        if (input_it != tool.end()) {
            auto [value, is_json] = normalize_tool_value(*input_it);
            fresh.input = std::move(value);
            fresh.input_is_json = is_json;
        }
        entry = &state_.add_tool(std::move(fresh));
    }

    if (entry->status == ToolStatus::Pending) entry->status = ToolStatus::Running;
    return *entry;
}

ToolInvocationEntry& ToolHandler::on_tool_result(const Json& payload) {
    std::optional<std::string> id;
    Json display = payload;

    if (payload.is_object()) {
        id = tool_use_id_of(payload);
        if (payload.contains("output")) {
            display = payload.at("output");
        } else if (payload.contains("content")) {
            display = payload.at("content");
        } else {
            Json stripped = Json::object();
            for (auto it = payload.begin(); it != payload.end(); ++it) {
                if (it.key() != "toolUseId" && it.key() != "tool_use_id") {
                    stripped[it.key()] = it.value();
                }
            }
            if (!stripped.empty()) display = std::move(stripped);
        }
    }

    ToolInvocationEntry* entry = id ? state_.find_tool(*id) : nullptr;
    if (!entry && !state_.tools.empty()) {
        // Unknown or missing id: the result belongs to the latest call
        entry = &state_.tools.back();
    }
    if (!entry) {
        ToolInvocationEntry fresh;
        fresh.name = state_.next_tool_name();
        fresh.id = id;
        entry = &state_.add_tool(std::move(fresh));
    }

    auto [value, is_json] = normalize_tool_value(display);
    entry->result = value.is_null() ? display : value;
    entry->result_is_json = is_json || display.is_object() || display.is_array();

    bool failed = false;
    if (payload.is_object()) {
        auto status = payload.find("status");
        failed = status != payload.end() && status->is_string() && *status == "error";
    }
    entry->status = failed ? ToolStatus::Error : ToolStatus::Complete;
    return *entry;
}

void ToolHandler::mark_force_stop() {
    for (auto& entry : state_.tools) {
        if (entry.status != ToolStatus::Complete) entry.status = ToolStatus::Error;
    }
}

void ToolHandler::finish() {
    if (state_.force_stop_error) return;
    for (auto& entry : state_.tools) {
        if (entry.status == ToolStatus::Pending || entry.status == ToolStatus::Running) {
            entry.status = ToolStatus::Complete;
        }
    }
}

} // namespace agentstream
