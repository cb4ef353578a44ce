#pragma once
#include <memory>
#include <string>
#include <vector>

namespace agentstream {

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create all built-in tools (calculator, weather)
std::vector<std::unique_ptr<Tool>> create_builtin_tools();

// Run the named tool with the given arguments. Unknown tools and tools that
// throw produce a failed ToolResult.
ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// Best-effort repair of truncated model-generated JSON: balances braces and
// brackets and drops trailing commas. Returns the input unchanged if the
// repair still does not parse; empty input becomes "{}".
std::string repair_json(const std::string& json_str);

} // namespace agentstream
