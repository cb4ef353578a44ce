#include "provider.hpp"
#include "config.hpp"
#include "providers/anthropic.hpp"
#include <stdexcept>

namespace agentstream {

ChatResponse Provider::chat_stream(const std::vector<ChatMessage>& messages,
                                   const std::vector<ToolSpec>& tools,
                                   const std::string& model,
                                   const ChatOptions& options,
                                   const StreamCallbacks& callbacks) {
    ChatResponse response = chat(messages, tools, model, options);
    if (!response.thinking.empty() && callbacks.on_thinking) {
        callbacks.on_thinking(response.thinking);
    }
    if (response.content && !response.content->empty() && callbacks.on_text) {
        callbacks.on_text(*response.content);
    }
    if (callbacks.on_tool_start) {
        for (const auto& call : response.tool_calls) {
            callbacks.on_tool_start(ToolCall{call.id, call.name, ""});
        }
    }
    return response;
}

std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http) {
    if (config.provider == "anthropic") {
        if (config.api_key.empty()) {
            throw std::invalid_argument(
                "No API key for anthropic. Set ANTHROPIC_API_KEY or \"api_key\" in "
                "~/.agentstream/config.json");
        }
        return std::make_unique<AnthropicProvider>(config.api_key, http, config.base_url);
    }
    throw std::invalid_argument("Unknown provider: " + config.provider);
}

} // namespace agentstream
