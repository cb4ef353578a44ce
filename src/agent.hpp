#pragma once
#include "computation.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentstream {

// Tool-using LLM agent exposed as a Computation. Each invoke() is one user
// turn: model calls and tool runs repeat until the model stops asking for
// tools, reporting progress as events along the way.
//
// History lives in memory only. Invocations are serialized, so a call that
// was abandoned after a timeout finishes before the next one starts.
class AgentComputation : public Computation {
public:
    AgentComputation(std::unique_ptr<Provider> provider,
                     std::vector<std::unique_ptr<Tool>> tools,
                     const Config& config);

    Json invoke(const std::string& input, const EventCallback& on_event) override;

    void clear_history();
    size_t history_size() const;

    // Non-blocking variants for callers that must not wait behind a turn
    // abandoned after a timeout. try_clear_history returns false, leaving
    // history untouched, while a turn is still running.
    bool try_clear_history();
    bool busy() const;

    void set_model(const std::string& model);
    std::string model() const;

private:
    ChatResponse call_model(const std::vector<ToolSpec>& specs,
                            const EventCallback& on_event);

    mutable std::mutex mutex_;
    std::unique_ptr<Provider> provider_;
    std::vector<std::unique_ptr<Tool>> tools_;
    std::vector<ChatMessage> history_;
    Config config_;
    std::string model_;
};

} // namespace agentstream
