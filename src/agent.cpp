#include "agent.hpp"
#include <iostream>
#include <utility>

namespace agentstream {

static Json parse_arguments(const std::string& arguments) {
    Json input = Json::parse(repair_json(arguments), nullptr, false);
    if (input.is_discarded()) return Json(arguments);
    return input;
}

static Json message_json(const ChatResponse& response) {
    Json content = Json::array();
    if (response.content && !response.content->empty()) {
        content.push_back({{"type", "text"}, {"text", *response.content}});
    }
    for (const auto& call : response.tool_calls) {
        content.push_back({{"type", "tool_use"},
                           {"id", call.id},
                           {"name", call.name},
                           {"input", parse_arguments(call.arguments)}});
    }
    return Json{{"role", "assistant"}, {"content", content}};
}

AgentComputation::AgentComputation(std::unique_ptr<Provider> provider,
                                   std::vector<std::unique_ptr<Tool>> tools,
                                   const Config& config)
    : provider_(std::move(provider))
    , tools_(std::move(tools))
    , config_(config)
    , model_(config.model)
{}

ChatResponse AgentComputation::call_model(const std::vector<ToolSpec>& specs,
                                          const EventCallback& on_event) {
    StreamCallbacks callbacks;
    callbacks.on_text = [&on_event](const std::string& delta) {
        on_event(Event(Json{{"data", delta}}));
    };
    callbacks.on_thinking = [&on_event](const std::string& delta) {
        on_event(Event(Json{{"reasoningText", delta}, {"reasoning", true}}));
    };
    callbacks.on_tool_start = [&on_event](const ToolCall& call) {
        on_event(Event(Json{{"current_tool_use", {{"toolUseId", call.id}, {"name", call.name}}}}));
    };

    ChatOptions options;
    options.temperature = config_.temperature;
    options.max_tokens = config_.agent.max_tokens;
    options.thinking_budget = config_.agent.thinking_budget;

    return provider_->chat_stream(history_, specs, model_, options, callbacks);
}

Json AgentComputation::invoke(const std::string& input, const EventCallback& on_event) {
    std::lock_guard<std::mutex> lock(mutex_);

    on_event(Event(Json{{"init_event_loop", true}}));
    on_event(Event(Json{{"start", true}}));
    on_event(Event(Json{{"start_event_loop", true}}));

    // A failed turn leaves history as it was before the turn
    const size_t turn_start = history_.size();

    if (history_.empty() && !config_.agent.system_prompt.empty()) {
        history_.push_back(ChatMessage{Role::System, config_.agent.system_prompt, {}, {}});
    }
    history_.push_back(ChatMessage{Role::User, input, {}, {}});

    std::vector<ToolSpec> specs;
    specs.reserve(tools_.size());
    for (const auto& tool : tools_) {
        specs.push_back(tool->spec());
    }

    Json tool_metrics = Json::object();
    Json final_message;
    std::string stop_reason;
    TokenUsage usage;
    uint32_t iterations = 0;

    try {
        while (iterations < config_.agent.max_tool_iterations) {
            iterations++;

            ChatResponse response = call_model(specs, on_event);
            usage.prompt_tokens += response.usage.prompt_tokens;
            usage.completion_tokens += response.usage.completion_tokens;
            stop_reason = response.stop_reason.empty() ? "end_turn" : response.stop_reason;

            if (!response.thinking_signature.empty()) {
                on_event(Event(Json{{"reasoning_signature", response.thinking_signature},
                                    {"reasoning", true}}));
            }

            ChatMessage assistant{Role::Assistant, response.content.value_or(""),
                                  response.tool_calls, {}};
            assistant.thinking = response.thinking;
            assistant.thinking_signature = response.thinking_signature;
            history_.push_back(std::move(assistant));

            final_message = message_json(response);
            on_event(Event(Json{{"event", {{"messageStop", {{"stopReason", stop_reason}}}}}}));
            on_event(Event(Json{{"message", final_message}}));

            if (!response.has_tool_calls()) break;

            for (const auto& call : response.tool_calls) {
                std::cerr << "[tool] " << call.name << '\n';
                ToolResult result = dispatch_tool(call.name, call.arguments, tools_);

                on_event(Event(Json{{"tool_result", {
                    {"toolUseId", call.id},
                    {"output", result.output},
                    {"status", result.success ? "success" : "error"}
                }}}));

                Json& metric = tool_metrics[call.id];
                if (metric.is_null()) {
                    metric = {
                        {"tool", {{"toolUseId", call.id},
                                  {"name", call.name},
                                  {"input", parse_arguments(call.arguments)}}},
                        {"call_count", 0},
                        {"success_count", 0}
                    };
                }
                metric["call_count"] = metric["call_count"].get<int>() + 1;
                if (result.success) {
                    metric["success_count"] = metric["success_count"].get<int>() + 1;
                }

                ChatMessage tool_msg{Role::Tool, result.output, {}, call.id};
                tool_msg.is_error = !result.success;
                history_.push_back(std::move(tool_msg));
            }

            if (iterations == config_.agent.max_tool_iterations) {
                stop_reason = "max_tool_iterations";
                const std::string notice = "[Max tool iterations reached]";
                on_event(Event(Json{{"data", "\n" + notice}}));
                final_message = {{"role", "assistant"},
                                 {"content", Json::array({{{"type", "text"}, {"text", notice}}})}};
                history_.push_back(ChatMessage{Role::Assistant, notice, {}, {}});
            }
        }
    } catch (const std::exception& e) {
        history_.resize(turn_start);
        std::cerr << "[agent] Turn failed: " << e.what() << '\n';
        throw;
    }

    on_event(Event(Json{{"complete", true}}));

    usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
    return Json{
        {"message", final_message},
        {"metrics", {
            {"tool_metrics", tool_metrics},
            {"cycle_count", iterations},
            {"usage", {{"inputTokens", usage.prompt_tokens},
                       {"outputTokens", usage.completion_tokens},
                       {"totalTokens", usage.total_tokens}}}
        }},
        {"stop_reason", stop_reason}
    };
}

void AgentComputation::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

bool AgentComputation::try_clear_history() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    history_.clear();
    return true;
}

bool AgentComputation::busy() const {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    return !lock.owns_lock();
}

size_t AgentComputation::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void AgentComputation::set_model(const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = model;
}

std::string AgentComputation::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

} // namespace agentstream
