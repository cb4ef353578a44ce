#include "config.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace agentstream {

nlohmann::json Config::defaults_json() {
    Config d;
    return {
        {"provider", d.provider},
        {"model", d.model},
        {"temperature", d.temperature},
        {"api_key", ""},
        {"base_url", ""},
        {"stream", {
            {"deadline_ms", static_cast<uint64_t>(d.stream.deadline.count())},
            {"wait_timeout_ms", static_cast<uint64_t>(d.stream.wait_timeout.count())},
            {"queue_capacity", d.stream.queue_capacity}
        }},
        {"marker", {
            {"open", d.marker.open},
            {"close", d.marker.close},
            {"lookahead", d.marker.lookahead}
        }},
        {"agent", {
            {"max_tool_iterations", d.agent.max_tool_iterations},
            {"max_tokens", d.agent.max_tokens},
            {"thinking_budget", d.agent.thinking_budget},
            {"system_prompt", d.agent.system_prompt}
        }},
        {"debug", {
            {"enabled", d.debug.enabled},
            {"max_events", d.debug.max_events},
            {"log_events", d.debug.log_events}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::invalid_argument("config root is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("api_key") && j["api_key"].is_string())
        cfg.api_key = j["api_key"].get<std::string>();
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("deadline_ms") && s["deadline_ms"].is_number_unsigned())
            cfg.stream.deadline = std::chrono::milliseconds(s["deadline_ms"].get<uint64_t>());
        if (s.contains("wait_timeout_ms") && s["wait_timeout_ms"].is_number_unsigned())
            cfg.stream.wait_timeout = std::chrono::milliseconds(s["wait_timeout_ms"].get<uint64_t>());
        if (s.contains("queue_capacity") && s["queue_capacity"].is_number_unsigned())
            cfg.stream.queue_capacity = s["queue_capacity"].get<size_t>();
    }

    if (j.contains("marker") && j["marker"].is_object()) {
        auto& m = j["marker"];
        if (m.contains("open") && m["open"].is_string() && !m["open"].get<std::string>().empty())
            cfg.marker.open = m["open"].get<std::string>();
        if (m.contains("close") && m["close"].is_string() && !m["close"].get<std::string>().empty())
            cfg.marker.close = m["close"].get<std::string>();
        if (m.contains("lookahead") && m["lookahead"].is_number_unsigned())
            cfg.marker.lookahead = m["lookahead"].get<size_t>();
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        if (a.contains("max_tool_iterations") && a["max_tool_iterations"].is_number_unsigned())
            cfg.agent.max_tool_iterations = a["max_tool_iterations"].get<uint32_t>();
        if (a.contains("max_tokens") && a["max_tokens"].is_number_unsigned())
            cfg.agent.max_tokens = a["max_tokens"].get<uint32_t>();
        if (a.contains("thinking_budget") && a["thinking_budget"].is_number_unsigned())
            cfg.agent.thinking_budget = a["thinking_budget"].get<uint32_t>();
        if (a.contains("system_prompt") && a["system_prompt"].is_string())
            cfg.agent.system_prompt = a["system_prompt"].get<std::string>();
    }

    if (j.contains("debug") && j["debug"].is_object()) {
        auto& d = j["debug"];
        if (d.contains("enabled") && d["enabled"].is_boolean())
            cfg.debug.enabled = d["enabled"].get<bool>();
        if (d.contains("max_events") && d["max_events"].is_number_unsigned())
            cfg.debug.max_events = d["max_events"].get<uint32_t>();
        if (d.contains("log_events") && d["log_events"].is_boolean())
            cfg.debug.log_events = d["log_events"].get<bool>();
    }

    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"); v && *v)
        api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"); v && *v)
        base_url = v;
    if (const char* v = std::getenv("AGENTSTREAM_MODEL"); v && *v)
        model = v;
}

} // namespace agentstream
