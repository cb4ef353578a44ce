#pragma once
#include "event.hpp"
#include <functional>
#include <string>

namespace agentstream {

// Receives each event as the computation produces it. Must be cheap and
// thread-safe; it runs on the computation's thread.
using EventCallback = std::function<void(Event event)>;

// A long-running, non-interruptible call (e.g. an LLM agent turn).
// invoke() blocks until done, reporting progress through on_event, and
// returns the final structured result or throws.
class Computation {
public:
    virtual ~Computation() = default;

    virtual Json invoke(const std::string& input, const EventCallback& on_event) = 0;
};

} // namespace agentstream
