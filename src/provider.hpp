#pragma once
#include "tool.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentstream {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
};

struct ChatMessage {
    Role role;
    std::string content;
    std::vector<ToolCall> tool_calls;         // assistant turns requesting tools
    std::optional<std::string> tool_call_id;  // tool results
    bool is_error = false;                    // tool results

    // Extended thinking block of an assistant turn; replayed with its
    // signature when the turn is sent back to the model.
    std::string thinking;
    std::string thinking_signature;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::string thinking;
    std::string thinking_signature;
    std::vector<ToolCall> tool_calls;
    TokenUsage usage;
    std::string model;
    std::string stop_reason;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Streaming hooks, invoked on the calling thread as deltas arrive.
struct StreamCallbacks {
    std::function<void(const std::string& delta)> on_text;
    std::function<void(const std::string& delta)> on_thinking;
    // A tool_use block opened; arguments are still empty.
    std::function<void(const ToolCall& call)> on_tool_start;
};

struct ChatOptions {
    double temperature = 0.7;
    uint32_t max_tokens = 4096;
    uint32_t thinking_budget = 0; // 0 = extended thinking off
};

// Abstract base class for LLM providers
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolSpec>& tools,
                              const std::string& model,
                              const ChatOptions& options) = 0;

    // Default: non-streaming call, reported as one text delta.
    virtual ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                                     const std::vector<ToolSpec>& tools,
                                     const std::string& model,
                                     const ChatOptions& options,
                                     const StreamCallbacks& callbacks);

    virtual bool supports_streaming() const { return false; }
    virtual std::string provider_name() const = 0;
};

class HttpClient;
struct Config;

// Factory: create the configured provider. Throws std::invalid_argument for
// an unknown provider name or a missing API key.
std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http);

} // namespace agentstream
