#include "stream_session.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace agentstream {

// ── EventQueue ──────────────────────────────────────────────────

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ > 0 && events_.size() >= capacity_ && !warned_) {
            warned_ = true;
            std::cerr << "[stream] Event queue above capacity (" << capacity_
                      << "), consumer is falling behind\n";
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<Event> EventQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = events_.size();
    events_.clear();
    warned_ = false;
    return n;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "idle";
        case SessionStatus::Running: return "running";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::ForcedStopped: return "forced_stopped";
        case SessionStatus::TimedOut: return "timed_out";
        case SessionStatus::Drained: return "drained";
    }
    return "idle";
}

// ── EventStream ─────────────────────────────────────────────────

EventStream::iterator::iterator(EventStream* stream) : stream_(stream) {
    advance();
}

EventStream::iterator& EventStream::iterator::operator++() {
    advance();
    return *this;
}

void EventStream::iterator::advance() {
    if (!stream_) return;
    current_ = stream_->next();
    if (!current_) stream_ = nullptr;
}

EventStream::EventStream(StreamSession& session) : session_(&session) {}

EventStream::~EventStream() {
    close();
}

EventStream::EventStream(EventStream&& other) noexcept : session_(other.session_) {
    other.session_ = nullptr;
}

std::optional<Event> EventStream::next() {
    if (!session_) return std::nullopt;
    return session_->next_event();
}

void EventStream::close() {
    if (!session_) return;
    session_->cleanup();
    session_ = nullptr;
}

// ── StreamSession ───────────────────────────────────────────────

StreamSession::StreamSession(std::shared_ptr<Computation> computation, StreamConfig config)
    : computation_(std::move(computation)), config_(config) {
    if (!computation_) throw std::invalid_argument("StreamSession requires a computation");
}

StreamSession::~StreamSession() {
    cleanup();
}

void StreamSession::start(const std::string& input) {
    if (stream_open_) {
        throw std::logic_error("Cannot start a session while its event stream is open");
    }
    // A previous run that was never iterated still owns a worker
    cleanup();

    state_.reset();
    discarded_ = 0;
    outcome_ = SessionStatus::Running;
    status_ = SessionStatus::Running;
    started_at_ = std::chrono::steady_clock::now();
    channel_ = std::make_shared<Channel>(config_.queue_capacity);

    // The worker only touches the channel, never state_
    worker_ = std::thread([computation = computation_, channel = channel_, input]() {
        EventCallback on_event = [&channel](Event event) {
            channel->queue.push(std::move(event));
        };
        try {
            Json result = computation->invoke(input, on_event);
            channel->queue.push(Event::result(std::move(result)));
        } catch (const std::exception& e) {
            channel->queue.push(Event::force_stop(e.what()));
        } catch (...) {
            channel->queue.push(Event::force_stop("Unknown error"));
        }
        channel->finished.store(true);
    });
}

EventStream StreamSession::events() {
    if (status_ != SessionStatus::Running || !channel_) {
        throw std::logic_error("events() requires a started session");
    }
    if (stream_open_) {
        throw std::logic_error("Session event stream is already open");
    }
    stream_open_ = true;
    return EventStream(*this);
}

void StreamSession::settle(SessionStatus status) {
    status_ = status;
    outcome_ = status;
}

std::optional<Event> StreamSession::next_event() {
    if (!channel_ || status_ != SessionStatus::Running) return std::nullopt;

    while (true) {
        auto event = channel_->queue.pop_for(config_.wait_timeout);
        if (event) {
            if (event->is_terminal()) {
                settle(event->has(event_keys::Result) ? SessionStatus::Completed
                                                      : SessionStatus::ForcedStopped);
            }
            return event;
        }

        if (channel_->finished.load()) {
            // The final push may have landed just after the wait gave up
            if (channel_->queue.size() > 0) continue;
            std::cerr << "[stream] Computation ended without a terminal event\n";
            settle(SessionStatus::Completed);
            return std::nullopt;
        }

        auto elapsed = std::chrono::steady_clock::now() - started_at_;
        if (elapsed > config_.deadline) {
            std::cerr << "[stream] No terminal event after " << config_.deadline.count()
                      << "ms, abandoning computation\n";
            settle(SessionStatus::TimedOut);
            return Event::force_stop("Timeout");
        }
    }
}

void StreamSession::cleanup() noexcept {
    stream_open_ = false;
    if (!channel_ || status_ == SessionStatus::Drained) return;

    if (worker_.joinable()) {
        if (status_ == SessionStatus::TimedOut && !channel_->finished.load()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }

    discarded_ = channel_->queue.drain();
    if (discarded_ > 0) {
        std::cerr << "[stream] Discarded " << discarded_ << " late event(s)\n";
    }
    status_ = SessionStatus::Drained;
}

} // namespace agentstream
