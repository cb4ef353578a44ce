#include "anthropic.hpp"
#include "sse.hpp"
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace agentstream {

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url) {}

bool AnthropicProvider::is_retryable(long status_code) {
    return status_code == 429 || status_code == 408 || status_code == 409 ||
           status_code == 529 || (status_code >= 500 && status_code < 600);
}

void AnthropicProvider::backoff_sleep(uint32_t attempt) {
    double delay = std::min(INITIAL_DELAY_S * std::pow(2.0, static_cast<double>(attempt)),
                            MAX_DELAY_S);
    auto ms = static_cast<long>(delay * 1000);
    std::cerr << "[anthropic] Rate limited, retrying in " << ms << "ms...\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::vector<Header> AnthropicProvider::headers() const {
    return {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };
}

static json tool_input(const std::string& arguments) {
    json input = json::parse(repair_json(arguments), nullptr, false);
    if (input.is_discarded() || !input.is_object()) return json::object();
    return input;
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                      const std::vector<ToolSpec>& tools,
                                      const std::string& model,
                                      const ChatOptions& options) const {
    json request;
    request["model"] = model;
    request["max_tokens"] = options.max_tokens;

    // Extended thinking requires the default temperature and a budget
    // below max_tokens.
    if (options.thinking_budget > 0) {
        request["thinking"] = {{"type", "enabled"}, {"budget_tokens", options.thinking_budget}};
        if (options.thinking_budget >= options.max_tokens) {
            request["max_tokens"] = options.thinking_budget + options.max_tokens;
        }
    } else {
        request["temperature"] = options.temperature;
    }

    // Extract system messages
    std::string system_text;
    for (const auto& msg : messages) {
        if (msg.role == Role::System) {
            if (!system_text.empty()) {
                system_text += "\n";
            }
            system_text += msg.content;
        }
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }

    json msgs = json::array();
    for (size_t i = 0; i < messages.size(); i++) {
        const auto& msg = messages[i];
        if (msg.role == Role::System) continue;

        json m;
        if (msg.role == Role::Tool) {
            // Consecutive tool results travel in one user message
            json tool_results = json::array();
            while (i < messages.size() && messages[i].role == Role::Tool) {
                json tool_result;
                tool_result["type"] = "tool_result";
                tool_result["tool_use_id"] = messages[i].tool_call_id.value_or("");
                tool_result["content"] = messages[i].content;
                if (messages[i].is_error) tool_result["is_error"] = true;
                tool_results.push_back(tool_result);
                i++;
            }
            i--; // adjust for outer loop increment
            m["role"] = "user";
            m["content"] = tool_results;
        } else if (msg.role == Role::Assistant &&
                   (!msg.tool_calls.empty() || !msg.thinking.empty())) {
            m["role"] = "assistant";
            json blocks = json::array();
            if (!msg.thinking.empty()) {
                blocks.push_back({{"type", "thinking"},
                                  {"thinking", msg.thinking},
                                  {"signature", msg.thinking_signature}});
            }
            if (!msg.content.empty()) {
                blocks.push_back({{"type", "text"}, {"text", msg.content}});
            }
            for (const auto& tc : msg.tool_calls) {
                blocks.push_back({{"type", "tool_use"},
                                  {"id", tc.id},
                                  {"name", tc.name},
                                  {"input", tool_input(tc.arguments)}});
            }
            m["content"] = blocks;
        } else {
            m["role"] = role_to_string(msg.role);
            m["content"] = msg.content;
        }
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            json t;
            t["name"] = tool.name;
            t["description"] = tool.description;
            t["input_schema"] = json::parse(tool.parameters_json);
            tools_arr.push_back(t);
        }
        request["tools"] = tools_arr;
    }

    return request;
}

ChatResponse AnthropicProvider::chat(const std::vector<ChatMessage>& messages,
                                     const std::vector<ToolSpec>& tools,
                                     const std::string& model,
                                     const ChatOptions& options) {
    std::string body = build_request(messages, tools, model, options).dump();

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        auto response = http_.post(base_url_ + "/messages", body, headers());

        if (response.status_code >= 200 && response.status_code < 300) {
            auto resp = json::parse(response.body);

            ChatResponse result;
            result.model = resp.value("model", model);
            if (resp.contains("stop_reason") && resp["stop_reason"].is_string()) {
                result.stop_reason = resp["stop_reason"].get<std::string>();
            }

            if (resp.contains("content") && resp["content"].is_array()) {
                for (const auto& block : resp["content"]) {
                    std::string type = block.value("type", "");
                    if (type == "text") {
                        result.content = result.content.value_or("") + block.value("text", "");
                    } else if (type == "thinking") {
                        result.thinking += block.value("thinking", "");
                        result.thinking_signature = block.value("signature", "");
                    } else if (type == "tool_use") {
                        ToolCall tc;
                        tc.id = block.value("id", "");
                        tc.name = block.value("name", "");
                        tc.arguments = block.contains("input") ? block["input"].dump() : "{}";
                        result.tool_calls.push_back(std::move(tc));
                    }
                }
            }

            if (resp.contains("usage")) {
                const auto& usage = resp["usage"];
                result.usage.prompt_tokens = usage.value("input_tokens", 0u);
                result.usage.completion_tokens = usage.value("output_tokens", 0u);
                result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;
            }

            return result;
        }

        if (response.status_code == 0) {
            throw std::runtime_error("Anthropic request failed: " +
                (response.error.empty() ? std::string("no response") : response.error));
        }

        if (is_retryable(response.status_code) && attempt < MAX_RETRIES) {
            backoff_sleep(attempt);
            continue;
        }

        throw std::runtime_error("Anthropic API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    throw std::runtime_error("Anthropic API error: max retries exceeded");
}

ChatResponse AnthropicProvider::chat_stream(const std::vector<ChatMessage>& messages,
                                            const std::vector<ToolSpec>& tools,
                                            const std::string& model,
                                            const ChatOptions& options,
                                            const StreamCallbacks& callbacks) {
    json request = build_request(messages, tools, model, options);
    request["stream"] = true;
    std::string body = request.dump();

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        ChatResponse result;
        result.model = model;
        std::string accumulated_text;

        SSEParser parser;
        bool stream_error = false;
        std::string error_body;
        std::string raw_body; // kept for non-SSE error responses
        bool got_events = false;

        auto on_event = [&](const SSEEvent& sse) -> bool {
            got_events = true;
            if (sse.event == "error") {
                stream_error = true;
                error_body = sse.data;
                return false;
            }

            json payload = json::parse(sse.data, nullptr, false);
            if (payload.is_discarded()) return true;

            if (sse.event == "message_start") {
                if (payload.contains("message")) {
                    const auto& msg = payload["message"];
                    result.model = msg.value("model", model);
                    if (msg.contains("usage")) {
                        result.usage.prompt_tokens = msg["usage"].value("input_tokens", 0u);
                    }
                }
            } else if (sse.event == "content_block_start") {
                if (payload.contains("content_block")) {
                    const auto& block = payload["content_block"];
                    if (block.value("type", "") == "tool_use") {
                        ToolCall tc;
                        tc.id = block.value("id", "");
                        tc.name = block.value("name", "");
                        if (callbacks.on_tool_start) callbacks.on_tool_start(tc);
                        result.tool_calls.push_back(std::move(tc));
                    }
                }
            } else if (sse.event == "content_block_delta") {
                if (payload.contains("delta")) {
                    const auto& delta = payload["delta"];
                    std::string delta_type = delta.value("type", "");
                    if (delta_type == "text_delta") {
                        std::string text = delta.value("text", "");
                        if (!text.empty()) {
                            accumulated_text += text;
                            if (callbacks.on_text) callbacks.on_text(text);
                        }
                    } else if (delta_type == "thinking_delta") {
                        std::string text = delta.value("thinking", "");
                        if (!text.empty()) {
                            result.thinking += text;
                            if (callbacks.on_thinking) callbacks.on_thinking(text);
                        }
                    } else if (delta_type == "signature_delta") {
                        result.thinking_signature += delta.value("signature", "");
                    } else if (delta_type == "input_json_delta" && !result.tool_calls.empty()) {
                        result.tool_calls.back().arguments += delta.value("partial_json", "");
                    }
                }
            } else if (sse.event == "message_delta") {
                if (payload.contains("delta") && payload["delta"].contains("stop_reason") &&
                    payload["delta"]["stop_reason"].is_string()) {
                    result.stop_reason = payload["delta"]["stop_reason"].get<std::string>();
                }
                if (payload.contains("usage")) {
                    result.usage.completion_tokens = payload["usage"].value("output_tokens", 0u);
                }
            }

            return true;
        };

        auto http_response = http_.stream_post_raw(
            base_url_ + "/messages", body, headers(),
            [&](const char* data, size_t len) -> bool {
                std::string chunk(data, len);
                if (raw_body.size() < 4096) raw_body += chunk;
                return parser.feed(chunk, on_event) && !stream_error;
            });

        if (stream_error) {
            throw std::runtime_error("Anthropic streaming error: " + error_body);
        }

        // Transport failure or abort, possibly mid-stream: the turn is incomplete
        if (http_response.status_code == 0) {
            throw std::runtime_error("Anthropic request failed: " +
                (http_response.error.empty() ? std::string("no response") : http_response.error));
        }

        // Retryable errors (429, overloaded) arrive before any stream event
        if (http_response.status_code < 200 || http_response.status_code >= 300) {
            if (!got_events && is_retryable(http_response.status_code) &&
                attempt < MAX_RETRIES) {
                backoff_sleep(attempt);
                continue;
            }
            std::string detail = http_response.body.empty() ? raw_body : http_response.body;
            throw std::runtime_error("Anthropic API error (HTTP " +
                std::to_string(http_response.status_code) + "): " + detail);
        }

        if (!accumulated_text.empty()) {
            result.content = accumulated_text;
        }
        for (auto& tc : result.tool_calls) {
            if (tc.arguments.empty()) tc.arguments = "{}";
        }

        result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;
        return result;
    }

    throw std::runtime_error("Anthropic API error: max retries exceeded");
}

} // namespace agentstream
