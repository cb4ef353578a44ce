#pragma once
#include "computation.hpp"
#include "event.hpp"
#include "session_state.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace agentstream {

struct StreamConfig {
    std::chrono::milliseconds deadline{30000};    // overall, since start()
    std::chrono::milliseconds wait_timeout{1000}; // per queue wait
    size_t queue_capacity = 1024;                 // 0 = unbounded
};

// FIFO handoff between the computation thread and the consumer.
// push() never blocks; exceeding the capacity only logs a warning, so no
// event is ever dropped while queued.
class EventQueue {
public:
    explicit EventQueue(size_t capacity = 0) : capacity_(capacity) {}

    void push(Event event);

    // Wait up to timeout for the next event.
    std::optional<Event> pop_for(std::chrono::milliseconds timeout);

    std::optional<Event> try_pop();

    // Discard everything queued; returns the number discarded.
    size_t drain();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    size_t capacity_;
    bool warned_ = false;
};

enum class SessionStatus { Idle, Running, Completed, ForcedStopped, TimedOut, Drained };

const char* session_status_name(SessionStatus status);

class StreamSession;

// Single-pass view over one session's events. Leaving the iteration by any
// path (end, break, exception) runs the session cleanup: the computation is
// joined (or abandoned after a timeout) and late events are discarded.
class EventStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Event;
        using difference_type = std::ptrdiff_t;
        using pointer = const Event*;
        using reference = const Event&;

        iterator() = default;
        explicit iterator(EventStream* stream);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance();

        EventStream* stream_ = nullptr;
        std::optional<Event> current_;
    };

    explicit EventStream(StreamSession& session);
    ~EventStream();

    EventStream(EventStream&& other) noexcept;
    EventStream& operator=(EventStream&&) = delete;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Next event, or nothing once the stream has ended.
    std::optional<Event> next();

    // Run cleanup now. Idempotent; also done by the destructor.
    void close();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    StreamSession* session_;
};

// Owns one background invocation of a Computation and the queue it feeds.
//
// The computation cannot be interrupted. After a timeout it is abandoned,
// not killed: the worker is detached and keeps shared ownership of the
// computation and of its own queue, so its late result is simply dropped.
class StreamSession {
public:
    explicit StreamSession(std::shared_ptr<Computation> computation,
                           StreamConfig config = {});
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Reset state, discard stale events and launch the computation.
    void start(const std::string& input);

    // Events of the started run. Only one stream may be open at a time.
    EventStream events();

    SessionState& state() { return state_; }
    const SessionState& state() const { return state_; }

    SessionStatus status() const { return status_; }

    // How the last run ended (Completed, ForcedStopped or TimedOut);
    // Idle/Running while none has.
    SessionStatus outcome() const { return outcome_; }

    // Events discarded by the last cleanup.
    size_t discarded_events() const { return discarded_; }

    const StreamConfig& config() const { return config_; }

private:
    friend class EventStream;

    struct Channel {
        explicit Channel(size_t capacity) : queue(capacity) {}
        EventQueue queue;
        std::atomic<bool> finished{false};
    };

    std::optional<Event> next_event();
    void cleanup() noexcept;
    void settle(SessionStatus status);

    std::shared_ptr<Computation> computation_;
    StreamConfig config_;
    SessionState state_;
    SessionStatus status_ = SessionStatus::Idle;
    SessionStatus outcome_ = SessionStatus::Idle;
    std::shared_ptr<Channel> channel_;
    std::thread worker_;
    std::chrono::steady_clock::time_point started_at_;
    bool stream_open_ = false;
    size_t discarded_ = 0;
};

} // namespace agentstream
