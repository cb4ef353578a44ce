#include "tool.hpp"
#include "tools/calculator.hpp"
#include "tools/weather.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace agentstream {

std::vector<std::unique_ptr<Tool>> create_builtin_tools() {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<CalculatorTool>());
    tools.push_back(std::make_unique<WeatherTool>());
    return tools;
}

ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() != name) continue;
        try {
            return tool->execute(args_json);
        } catch (const std::exception& e) {
            std::cerr << "[tool] " << name << " threw: " << e.what() << '\n';
            return ToolResult{false, std::string("Tool failed: ") + e.what()};
        }
    }
    return ToolResult{false, "Unknown tool: " + name};
}

std::string repair_json(const std::string& json_str) {
    std::string s = trim(json_str);
    if (s.empty()) return "{}";

    // Balance braces, ignoring those inside string literals
    int brace_count = 0;
    int bracket_count = 0;
    bool in_string = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }
    if (in_string) s += '"';

    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Remove trailing commas before } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        result += s[i];
    }

    if (nlohmann::json::accept(result)) return result;
    return json_str;
}

} // namespace agentstream
