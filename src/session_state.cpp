#include "session_state.hpp"
#include "util.hpp"

namespace agentstream {

bool ToolInvocationEntry::input_empty() const {
    if (input.is_null()) return true;
    if (input.is_string()) return trim(input.get<std::string>()).empty();
    if (input.is_array() || input.is_object()) return input.empty();
    return false;
}

void SessionState::reset() {
    raw_text.clear();
    filtered_text.clear();
    hidden_text.reset();
    reasoning_text.clear();
    final_result.reset();
    force_stop_error.reset();
    tools.clear();
    tool_index_.clear();
}

ToolInvocationEntry* SessionState::find_tool(const std::string& id) {
    auto it = tool_index_.find(id);
    if (it == tool_index_.end()) return nullptr;
    return &tools[it->second];
}

ToolInvocationEntry& SessionState::add_tool(ToolInvocationEntry entry) {
    if (entry.id && !entry.id->empty()) {
        tool_index_[*entry.id] = tools.size();
    }
    tools.push_back(std::move(entry));
    return tools.back();
}

std::string SessionState::next_tool_name() const {
    return "Tool " + std::to_string(tools.size() + 1);
}

std::pair<Json, bool> normalize_tool_value(const Json& value) {
    if (value.is_null()) return {Json(), false};
    if (value.is_object() || value.is_array()) return {value, true};
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::string candidate = trim(text);
        if (!candidate.empty() && (candidate[0] == '{' || candidate[0] == '[')) {
            Json parsed = Json::parse(text, nullptr, false);
            if (!parsed.is_discarded()) return {parsed, true};
        }
    }
    return {value, false};
}

std::optional<std::string> tool_use_id_of(const Json& payload) {
    if (!payload.is_object()) return std::nullopt;
    for (const char* key : {"toolUseId", "tool_use_id"}) {
        auto it = payload.find(key);
        if (it != payload.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

} // namespace agentstream
