#pragma once
#include "../tool.hpp"

namespace agentstream {

// Canned weather report; no network access.
class WeatherTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "weather"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace agentstream
