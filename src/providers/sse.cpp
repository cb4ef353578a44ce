#include "sse.hpp"

namespace agentstream {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (!line.empty()) {
            parse_line(line);
            continue;
        }

        // Blank line = dispatch event
        if (has_data_) {
            SSEEvent event{event_, data_};
            event_.clear();
            data_.clear();
            has_data_ = false;
            if (!callback(event)) {
                buffer_.erase(0, pos);
                return false;
            }
        }
        event_.clear();
    }

    buffer_.erase(0, pos);
    return true;
}

void SSEParser::parse_line(const std::string& line) {
    if (line[0] == ':') return; // comment / keep-alive

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        // A single leading space after the colon is not part of the value
        size_t start = colon + 1;
        if (start < line.size() && line[start] == ' ') start++;
        value = line.substr(start);
    }

    if (field == "event") {
        event_ = value;
    } else if (field == "data") {
        if (has_data_) data_ += '\n';
        data_ += value;
        has_data_ = true;
    }
    // id / retry / unknown fields are ignored
}

void SSEParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace agentstream
