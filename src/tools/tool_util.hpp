#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentstream {

// Arguments arrive as streamed model output and may be truncated, so they
// go through repair_json before parsing. On success `out` holds the field
// and nullopt is returned; otherwise the failed ToolResult to report.
inline std::optional<ToolResult> string_arg(const std::string& args_json,
                                            const char* field, std::string& out) {
    nlohmann::json args = nlohmann::json::parse(repair_json(args_json), nullptr, false);
    if (args.is_discarded()) {
        return ToolResult{false, "Failed to parse arguments: " + args_json};
    }
    if (!args.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object"};
    }
    auto it = args.find(field);
    if (it == args.end() || !it->is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    out = it->get<std::string>();
    return std::nullopt;
}

} // namespace agentstream
