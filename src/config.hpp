#pragma once
#include "marker_splitter.hpp"
#include "stream_session.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace agentstream {

struct AgentConfig {
    uint32_t max_tool_iterations = 10;
    uint32_t max_tokens = 4096;
    uint32_t thinking_budget = 0; // 0 = extended thinking off
    std::string system_prompt =
        "You are a helpful assistant. Use the calculator and weather tools when "
        "they help answer the question.";
};

struct DebugConfig {
    bool enabled = false;     // DebugHandler records events from the start
    uint32_t max_events = 100;
    bool log_events = false;  // register the LoggingHandler
};

struct Config {
    std::string provider = "anthropic";
    std::string model = "claude-sonnet-4-20250514";
    double temperature = 0.7;
    std::string api_key;
    std::string base_url; // empty = provider default

    StreamConfig stream;
    MarkerConfig marker;
    AgentConfig agent;
    DebugConfig debug;

    static constexpr const char* DEFAULT_PATH = "~/.agentstream/config.json";

    // Load from the config file (created with defaults when missing,
    // migrated with new defaults when present) + env vars.
    static Config load(const std::string& path = DEFAULT_PATH);

    // Parse a config document. Fields of the wrong type keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // ANTHROPIC_API_KEY, ANTHROPIC_BASE_URL and AGENTSTREAM_MODEL win over the file.
    void apply_env_overrides();
};

} // namespace agentstream
