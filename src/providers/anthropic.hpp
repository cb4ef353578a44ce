#pragma once
#include "../http.hpp"
#include "../provider.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace agentstream {

// Anthropic Messages API with native tool use, SSE streaming and
// optional extended thinking.
class AnthropicProvider : public Provider {
public:
    AnthropicProvider(const std::string& api_key, HttpClient& http,
                      const std::string& base_url = "");

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::vector<ToolSpec>& tools,
                      const std::string& model,
                      const ChatOptions& options) override;

    ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                             const std::vector<ToolSpec>& tools,
                             const std::string& model,
                             const ChatOptions& options,
                             const StreamCallbacks& callbacks) override;

    bool supports_streaming() const override { return true; }
    std::string provider_name() const override { return "anthropic"; }

    // Exposed for tests.
    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const std::string& model,
                                 const ChatOptions& options) const;

private:
    std::vector<Header> headers() const;
    static bool is_retryable(long status_code);
    static void backoff_sleep(uint32_t attempt);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr uint32_t MAX_RETRIES = 2;
    static constexpr double INITIAL_DELAY_S = 0.5;
    static constexpr double MAX_DELAY_S = 8.0;
};

} // namespace agentstream
