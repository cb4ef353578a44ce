#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <iterator>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace agentstream;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.temperature == 0.7);
    REQUIRE(cfg.api_key.empty());
    REQUIRE(cfg.stream.deadline == std::chrono::milliseconds(30000));
    REQUIRE(cfg.marker.open == "<thinking>");
    REQUIRE(cfg.marker.close == "</thinking>");
    REQUIRE_FALSE(cfg.debug.enabled);
}

TEST_CASE("AgentConfig: default values", "[config]") {
    AgentConfig ac;
    REQUIRE(ac.max_tool_iterations == 10);
    REQUIRE(ac.max_tokens == 4096);
    REQUIRE(ac.thinking_budget == 0);
    REQUIRE_FALSE(ac.system_prompt.empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    nlohmann::json j = {
        {"model", "claude-test"},
        {"temperature", 0.2},
        {"api_key", "sk-file"},
        {"base_url", "http://localhost:9000"},
        {"stream", {{"deadline_ms", 5000}, {"wait_timeout_ms", 250}, {"queue_capacity", 64}}},
        {"marker", {{"open", "<think>"}, {"close", "</think>"}, {"lookahead", 32}}},
        {"agent", {{"max_tool_iterations", 3}, {"thinking_budget", 2048}, {"system_prompt", "Be terse."}}},
        {"debug", {{"enabled", true}, {"max_events", 10}, {"log_events", true}}}
    };
    Config cfg = Config::from_json(j);

    REQUIRE(cfg.model == "claude-test");
    REQUIRE(cfg.temperature == 0.2);
    REQUIRE(cfg.api_key == "sk-file");
    REQUIRE(cfg.base_url == "http://localhost:9000");
    REQUIRE(cfg.stream.deadline == std::chrono::milliseconds(5000));
    REQUIRE(cfg.stream.wait_timeout == std::chrono::milliseconds(250));
    REQUIRE(cfg.stream.queue_capacity == 64);
    REQUIRE(cfg.marker.open == "<think>");
    REQUIRE(cfg.marker.lookahead == 32);
    REQUIRE(cfg.agent.max_tool_iterations == 3);
    REQUIRE(cfg.agent.thinking_budget == 2048);
    REQUIRE(cfg.agent.system_prompt == "Be terse.");
    REQUIRE(cfg.debug.enabled);
    REQUIRE(cfg.debug.max_events == 10);
    REQUIRE(cfg.debug.log_events);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    nlohmann::json j = {
        {"model", 42},
        {"temperature", "hot"},
        {"stream", {{"deadline_ms", -5}}},
        {"marker", {{"open", ""}, {"lookahead", "big"}}},
        {"debug", "yes"}
    };
    Config cfg = Config::from_json(j);
    Config d;
    REQUIRE(cfg.model == d.model);
    REQUIRE(cfg.temperature == d.temperature);
    REQUIRE(cfg.stream.deadline == d.stream.deadline);
    REQUIRE(cfg.marker.open == d.marker.open);
    REQUIRE(cfg.marker.lookahead == d.marker.lookahead);
    REQUIRE(cfg.debug.enabled == d.debug.enabled);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.provider == "anthropic");
}

TEST_CASE("Config::defaults_json: parses back to defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config d;
    REQUIRE(cfg.model == d.model);
    REQUIRE(cfg.stream.deadline == d.stream.deadline);
    REQUIRE(cfg.stream.queue_capacity == d.stream.queue_capacity);
    REQUIRE(cfg.marker.lookahead == d.marker.lookahead);
    REQUIRE(cfg.agent.system_prompt == d.agent.system_prompt);
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "agentstream_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("ANTHROPIC_BASE_URL");
        unsetenv("AGENTSTREAM_MODEL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.agentstream/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.agentstream");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"api_key": "sk-file", "model": "claude-file", "marker": {"open": "<think>"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key == "sk-file");
    REQUIRE(cfg.model == "claude-file");
    REQUIRE(cfg.marker.open == "<think>");
    REQUIRE(cfg.marker.close == "</thinking>");
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    std::string path = g.dir + "/custom/settings.json";

    Config cfg = Config::load(path);
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"api_key": "from-file", "model": "file-model"})");

    setenv("ANTHROPIC_API_KEY", "from-env", 1);
    setenv("ANTHROPIC_BASE_URL", "http://env:1234", 1);
    setenv("AGENTSTREAM_MODEL", "env-model", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key == "from-env");
    REQUIRE(cfg.base_url == "http://env:1234");
    REQUIRE(cfg.model == "env-model");

    unsetenv("ANTHROPIC_API_KEY");
    unsetenv("ANTHROPIC_BASE_URL");
    unsetenv("AGENTSTREAM_MODEL");
}

TEST_CASE("Config::load: empty env vars are ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"api_key": "from-file"})");

    setenv("ANTHROPIC_API_KEY", "", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.api_key == "from-file");
    unsetenv("ANTHROPIC_API_KEY");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config("{not valid json");

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.api_key.empty());
    // The broken file is left for the user to fix
    REQUIRE(read_file(g.config_path()) == "{not valid json");
}

TEST_CASE("Config::load: non-object root falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config("[1, 2, 3]");

    Config cfg = Config::load();
    REQUIRE(cfg.model == Config().model);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));

    nlohmann::json j = nlohmann::json::parse(read_file(g.config_path()));
    REQUIRE(j["provider"] == "anthropic");
    REQUIRE(j["stream"]["deadline_ms"] == 30000);
    REQUIRE(j["marker"]["open"] == "<thinking>");
    REQUIRE(j["agent"].contains("max_tool_iterations"));
    REQUIRE(j["debug"]["max_events"] == 100);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"api_key": "sk-test", "stream": {"deadline_ms": 5000}})");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key == "sk-test");
    REQUIRE(cfg.stream.deadline == std::chrono::milliseconds(5000));

    nlohmann::json j = nlohmann::json::parse(read_file(g.config_path()));
    REQUIRE(j["api_key"] == "sk-test");
    REQUIRE(j["stream"]["deadline_ms"] == 5000);
    REQUIRE(j["stream"]["wait_timeout_ms"] == 1000);
    REQUIRE(j["agent"]["max_tool_iterations"] == 10);
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["model"] = "claude-custom";
    full["agent"]["max_tool_iterations"] = 5;
    g.write_config(full.dump(4) + "\n");

    std::string before = read_file(g.config_path());
    Config cfg = Config::load();

    REQUIRE(cfg.model == "claude-custom");
    REQUIRE(cfg.agent.max_tool_iterations == 5);
    REQUIRE(read_file(g.config_path()) == before);
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = read_file(g.config_path());
    Config::load();
    REQUIRE(read_file(g.config_path()) == first);
}
