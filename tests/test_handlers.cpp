#include <catch2/catch_test_macros.hpp>
#include "handlers/lifecycle_handlers.hpp"
#include "handlers/message_handler.hpp"
#include "handlers/tool_handler.hpp"
#include "session_state.hpp"
#include <optional>
#include <sstream>
#include <string>

using namespace agentstream;

static MarkerConfig think_markers() {
    MarkerConfig cfg;
    cfg.open = "<think>";
    cfg.close = "</think>";
    cfg.lookahead = 20;
    return cfg;
}

// ── MessageHandler ───────────────────────────────────────────────

TEST_CASE("MessageHandler: separates visible and hidden text", "[handlers]") {
    SessionState state;
    MessageHandler handler(state, think_markers());

    for (const char* chunk : {"Hello ", "<think>reasoning here</think>", "World"}) {
        handler.handle(Event(Json{{"data", chunk}}));
    }
    handler.finish();

    REQUIRE(state.raw_text == "Hello <think>reasoning here</think>World");
    REQUIRE(state.filtered_text == "Hello World");
    REQUIRE(state.hidden_text == std::optional<std::string>("reasoning here"));
}

TEST_CASE("MessageHandler: ignores non-string and empty data", "[handlers]") {
    SessionState state;
    MessageHandler handler(state, think_markers());
    handler.handle(Event(Json{{"data", 42}}));
    handler.handle(Event(Json{{"data", ""}}));
    handler.finish();
    REQUIRE(state.raw_text.empty());
    REQUIRE(state.filtered_text.empty());
}

TEST_CASE("MessageHandler: records result and reports metrics", "[handlers]") {
    SessionState state;
    MessageHandler handler(state);

    Json result = {{"message", "done"}, {"metrics", {{"tool_metrics", {{"t1", {{"call_count", 1}}}}}}}};
    auto out = handler.handle(Event::result(result));

    REQUIRE(state.final_result.has_value());
    REQUIRE((*state.final_result)["message"] == "done");
    REQUIRE(out.has_value());
    REQUIRE((*out)["metrics"]["tool_metrics"].contains("t1"));
}

TEST_CASE("MessageHandler: result without metrics has no output", "[handlers]") {
    SessionState state;
    MessageHandler handler(state);
    REQUIRE_FALSE(handler.handle(Event::result(Json{{"message", "x"}})).has_value());
    REQUIRE_FALSE(handler.handle(Event::result(Json{{"metrics", Json::object()}})).has_value());
}

TEST_CASE("MessageHandler: forced stop records the error", "[handlers]") {
    SessionState state;
    MessageHandler handler(state);

    handler.handle(Event::force_stop("broken"));
    REQUIRE(state.force_stop_error == std::optional<std::string>("Error: broken"));

    SessionState other;
    MessageHandler no_reason(other);
    no_reason.handle(Event(Json{{"force_stop", true}}));
    REQUIRE(other.force_stop_error == std::optional<std::string>("Error: Unknown error"));
}

TEST_CASE("MessageHandler: reset clears splitter state between streams", "[handlers]") {
    SessionState state;
    MessageHandler handler(state, think_markers());
    handler.handle(Event(Json{{"data", "plain text longer than the window"}}));
    handler.finish();

    state.reset();
    handler.reset();
    handler.handle(Event(Json{{"data", "<think>x</think>visible"}}));
    handler.finish();
    REQUIRE(state.filtered_text == "visible");
    REQUIRE(state.hidden_text == std::optional<std::string>("x"));
}

// ── ToolHandler ──────────────────────────────────────────────────

TEST_CASE("ToolHandler: tool use then result", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);

    auto started = handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t1"}, {"name", "calculator"}}}}));
    REQUIRE(started.has_value());
    REQUIRE((*started)["tool_update"]["status"] == "running");
    REQUIRE(state.tools.size() == 1);
    REQUIRE(state.tools[0].name == "calculator");
    REQUIRE(state.tools[0].input_empty());

    auto done = handler.handle(Event(Json{{"tool_result", {{"toolUseId", "t1"}, {"output", "42"}}}}));
    REQUIRE((*done)["tool_update"]["id"] == "t1");
    REQUIRE((*done)["tool_update"]["status"] == "complete");
    REQUIRE(state.tools[0].result == "42");
    REQUIRE_FALSE(state.tools[0].result_is_json);
}

TEST_CASE("ToolHandler: repeated tool use with the same id updates one entry", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    for (int i = 0; i < 3; i++) {
        handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t1"}, {"name", "calc"}}}}));
    }
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t2"}, {"name", "calc"}}}}));
    REQUIRE(state.tools.size() == 2);
}

TEST_CASE("ToolHandler: structured inputs and results", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {
        {"toolUseId", "t1"}, {"name", "weather"}, {"input", "{\"location\":\"Oslo\"}"}}}}));
    REQUIRE(state.tools[0].input_is_json);
    REQUIRE(state.tools[0].input["location"] == "Oslo");

    handler.handle(Event(Json{{"tool_result", {{"toolUseId", "t1"}, {"output", {{"temp", 22}}}}}}));
    REQUIRE(state.tools[0].result_is_json);
    REQUIRE(state.tools[0].result["temp"] == 22);
}

TEST_CASE("ToolHandler: error status marks the entry failed", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t1"}, {"name", "calc"}}}}));
    auto out = handler.handle(Event(Json{{"tool_result", {
        {"toolUseId", "t1"}, {"output", "Error: Division by zero"}, {"status", "error"}}}}));
    REQUIRE((*out)["tool_update"]["status"] == "error");
    REQUIRE(state.tools[0].status == ToolStatus::Error);
}

TEST_CASE("ToolHandler: unnamed tools get numbered names", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "a"}}}}));
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "b"}}}}));
    REQUIRE(state.tools[0].name == "Tool 1");
    REQUIRE(state.tools[1].name == "Tool 2");
}

TEST_CASE("ToolHandler: result with an unknown id goes to the latest entry", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "a"}, {"name", "calculator"}}}}));
    handler.handle(Event(Json{{"tool_result", {{"toolUseId", "b"}, {"output", "42"}}}}));

    REQUIRE(state.tools.size() == 1);
    REQUIRE(state.tools[0].name == "calculator");
    REQUIRE(state.tools[0].result == "42");
}

TEST_CASE("ToolHandler: result with no entries creates a numbered one", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"tool_result", {{"toolUseId", "b"}, {"output", "42"}}}}));

    REQUIRE(state.tools.size() == 1);
    REQUIRE(state.tools[0].name == "Tool 1");
    REQUIRE(state.tools[0].id == std::optional<std::string>("b"));
    REQUIRE(state.tools[0].result == "42");
}

TEST_CASE("ToolHandler: finish completes open entries", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t1"}, {"name", "calc"}}}}));
    handler.finish();
    REQUIRE(state.tools[0].status == ToolStatus::Complete);
}

TEST_CASE("ToolHandler: forced stop fails unfinished entries", "[handlers]") {
    SessionState state;
    ToolHandler handler(state);
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t1"}, {"name", "calc"}}}}));
    handler.handle(Event(Json{{"current_tool_use", {{"toolUseId", "t2"}, {"name", "weather"}}}}));
    handler.handle(Event(Json{{"tool_result", {{"toolUseId", "t1"}, {"output", "4"}}}}));

    handler.handle(Event::force_stop("Timeout"));
    state.force_stop_error = "Error: Timeout";
    handler.finish();

    REQUIRE(state.tools[0].status == ToolStatus::Complete);
    REQUIRE(state.tools[1].status == ToolStatus::Error);
}

// ── ReasoningHandler / LifecycleHandler ──────────────────────────

TEST_CASE("ReasoningHandler: accumulates reasoning text", "[handlers]") {
    SessionState state;
    ReasoningHandler handler(state);
    REQUIRE(handler.can_handle(EventKind::ReasoningText));
    REQUIRE_FALSE(handler.can_handle(EventKind::Data));

    handler.handle(Event(Json{{"reasoningText", "step one. "}, {"reasoning", true}}));
    auto out = handler.handle(Event(Json{{"reasoningText", "step two."}, {"reasoning", true}}));
    REQUIRE(state.reasoning_text == "step one. step two.");
    REQUIRE((*out)["reasoning_processed"] == "reasoningText");
}

TEST_CASE("LifecycleHandler: acknowledges lifecycle steps", "[handlers]") {
    LifecycleHandler handler;
    REQUIRE(handler.can_handle(EventKind::Complete));
    REQUIRE_FALSE(handler.can_handle(EventKind::Data));
    auto out = handler.handle(Event(Json{{"init_event_loop", true}}));
    REQUIRE((*out)["lifecycle_processed"] == "init_event_loop");
}

// ── LoggingHandler / DebugHandler ────────────────────────────────

TEST_CASE("LoggingHandler: writes one line per event", "[handlers]") {
    std::ostringstream out;
    LoggingHandler handler(out);
    REQUIRE_FALSE(handler.handle(Event(Json{{"data", "hello"}})).has_value());
    handler.handle(Event::force_stop("Timeout"));

    std::string log = out.str();
    REQUIRE(log.find("[event] data keys=[data] chars=5\n") != std::string::npos);
    REQUIRE(log.find("[event] force_stop keys=[force_stop, force_stop_reason] reason=\"Timeout\"")
            != std::string::npos);
}

TEST_CASE("DebugHandler: disabled by default", "[handlers]") {
    DebugHandler handler;
    REQUIRE_FALSE(handler.enabled());
    REQUIRE_FALSE(handler.can_handle(EventKind::Data));
}

TEST_CASE("DebugHandler: keeps the most recent events", "[handlers]") {
    DebugHandler handler(3, true);
    for (int i = 0; i < 5; i++) {
        handler.handle(Event(Json{{"data", std::to_string(i)}}));
    }
    REQUIRE(handler.events().size() == 3);
    REQUIRE(handler.events().front().event_data["data"] == "2");
    REQUIRE(handler.events().back().event_type == "data");

    handler.clear();
    REQUIRE(handler.events().empty());

    handler.set_enabled(false);
    handler.handle(Event(Json{{"data", "ignored"}}));
    REQUIRE(handler.events().empty());
}

// ── Tool value normalization ─────────────────────────────────────

TEST_CASE("normalize_tool_value: structure detection", "[handlers]") {
    auto [null_value, null_json] = normalize_tool_value(Json());
    REQUIRE(null_value.is_null());
    REQUIRE_FALSE(null_json);

    auto [object, object_json] = normalize_tool_value(Json{{"x", 1}});
    REQUIRE(object == Json{{"x", 1}});
    REQUIRE(object_json);

    auto [parsed, parsed_json] = normalize_tool_value(Json("  [1, 2]"));
    REQUIRE(parsed == Json::array({1, 2}));
    REQUIRE(parsed_json);

    auto [broken, broken_json] = normalize_tool_value(Json("{not json"));
    REQUIRE(broken == "{not json");
    REQUIRE_FALSE(broken_json);

    auto [plain, plain_json] = normalize_tool_value(Json("42"));
    REQUIRE(plain == "42");
    REQUIRE_FALSE(plain_json);
}

TEST_CASE("tool_use_id_of: accepts both key spellings", "[handlers]") {
    REQUIRE(tool_use_id_of(Json{{"toolUseId", "a"}}) == std::optional<std::string>("a"));
    REQUIRE(tool_use_id_of(Json{{"tool_use_id", "b"}}) == std::optional<std::string>("b"));
    REQUIRE_FALSE(tool_use_id_of(Json{{"toolUseId", ""}}).has_value());
    REQUIRE_FALSE(tool_use_id_of(Json("t1")).has_value());
}
