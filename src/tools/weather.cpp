#include "weather.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

namespace agentstream {

ToolResult WeatherTool::execute(const std::string& args_json) {
    std::string location;
    if (auto err = string_arg(args_json, "location", location)) return *err;

    location = trim(location);
    if (location.empty()) {
        return ToolResult{false, "Location must not be empty"};
    }
    return ToolResult{true, "Weather in " + location + ": Sunny, 22°C (Mock data)"};
}

std::string WeatherTool::description() const {
    return "Get weather information for a location";
}

std::string WeatherTool::parameters_json() const {
    return R"({"type":"object","properties":{"location":{"type":"string","description":"City or place name"}},"required":["location"]})";
}

} // namespace agentstream
