#include "marker_splitter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace agentstream {

MarkerSplitter::MarkerSplitter() : MarkerSplitter(MarkerConfig{}) {}

MarkerSplitter::MarkerSplitter(MarkerConfig config) : config_(std::move(config)) {
    if (config_.open.empty() || config_.close.empty()) {
        throw std::invalid_argument("Marker delimiters must not be empty");
    }
    config_.lookahead = std::max(config_.lookahead, config_.open.size());
}

std::string MarkerSplitter::feed(const std::string& chunk) {
    switch (mode_) {
        case Mode::PassThrough:
            return chunk;

        case Mode::Inside:
            hidden_buffer_ += chunk;
            return try_close();

        case Mode::Detecting:
            break;
    }

    pending_ += chunk;
    if (pending_.size() < config_.lookahead) return "";

    // The whole buffer is searched once it fills, wherever the marker sits.
    size_t pos = pending_.find(config_.open);
    if (pos != std::string::npos) return open_marker(pos);

    // A marker still forming at the tail keeps the decision open
    if (ends_with_open_prefix()) return "";

    mode_ = Mode::PassThrough;
    std::string out = std::move(pending_);
    pending_.clear();
    return out;
}

std::string MarkerSplitter::finish() {
    switch (mode_) {
        case Mode::PassThrough:
            return "";

        case Mode::Inside:
            hidden_buffer_.clear();
            mode_ = Mode::PassThrough;
            return "";

        case Mode::Detecting:
            break;
    }

    // Stream shorter than the lookahead: decide on what we have.
    size_t pos = pending_.find(config_.open);
    if (pos == std::string::npos) {
        mode_ = Mode::PassThrough;
        std::string out = std::move(pending_);
        pending_.clear();
        return out;
    }

    std::string visible = open_marker(pos);
    if (mode_ == Mode::Inside) {
        // Opened but never closed
        hidden_buffer_.clear();
        mode_ = Mode::PassThrough;
    }
    return visible;
}

void MarkerSplitter::reset() {
    mode_ = Mode::Detecting;
    pending_.clear();
    hidden_buffer_.clear();
    hidden_.reset();
}

std::string MarkerSplitter::open_marker(size_t pos) {
    std::string visible = pending_.substr(0, pos);
    hidden_buffer_ = pending_.substr(pos);
    pending_.clear();
    mode_ = Mode::Inside;
    return visible + try_close();
}

bool MarkerSplitter::ends_with_open_prefix() const {
    const std::string& open = config_.open;
    size_t longest = std::min(pending_.size(), open.size() - 1);
    for (size_t len = longest; len > 0; len--) {
        if (pending_.compare(pending_.size() - len, len, open, 0, len) == 0) return true;
    }
    return false;
}

std::string MarkerSplitter::try_close() {
    const std::string& open = config_.open;
    const std::string& close = config_.close;
    if (hidden_buffer_.find(close, open.size()) == std::string::npos) return "";

    // Consume every complete pair already buffered. Text between pairs is
    // visible; the last pair's contents win.
    std::string visible;
    size_t pos = 0;
    while (true) {
        size_t start = hidden_buffer_.find(open, pos);
        if (start == std::string::npos) break;
        size_t end = hidden_buffer_.find(close, start + open.size());
        if (end == std::string::npos) break;
        visible += hidden_buffer_.substr(pos, start - pos);
        hidden_ = hidden_buffer_.substr(start + open.size(), end - start - open.size());
        pos = end + close.size();
    }
    visible += hidden_buffer_.substr(pos);
    hidden_buffer_.clear();
    mode_ = Mode::PassThrough;
    return visible;
}

} // namespace agentstream
