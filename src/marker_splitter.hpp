#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace agentstream {

struct MarkerConfig {
    std::string open = "<thinking>";
    std::string close = "</thinking>";
    size_t lookahead = 20; // chars buffered before committing to "no marker"
};

// Incrementally separates a character stream into visible text and the text
// hidden between an open/close marker pair. Markers may be split across any
// number of chunks.
//
// Nothing is emitted until `lookahead` characters have arrived (the lookahead
// is never smaller than the opening marker). The buffered text is then
// searched for the opening marker; if none is present, and none is half
// formed at the tail, all further chunks pass through untouched. Visible
// text is never retracted; hidden text is only available after the closing
// marker arrives. When several complete pairs are buffered at close time,
// the last one is kept.
class MarkerSplitter {
public:
    MarkerSplitter();
    explicit MarkerSplitter(MarkerConfig config);

    // Feed the next chunk. Returns the newly available visible text,
    // possibly empty while undecided or inside the marker.
    std::string feed(const std::string& chunk);

    // End of stream: settle any pending decision and return remaining
    // visible text. A marker left open is dropped, never surfaced.
    std::string finish();

    // Hidden text of the resolved marker pair, if one closed.
    const std::optional<std::string>& hidden() const { return hidden_; }

    bool inside_marker() const { return mode_ == Mode::Inside; }
    bool passing_through() const { return mode_ == Mode::PassThrough; }

    // Clear all buffers and state for reuse on a new stream.
    void reset();

    const MarkerConfig& config() const { return config_; }

private:
    enum class Mode { Detecting, Inside, PassThrough };

    // Enter marker mode at `pos` in pending_; returns the visible prefix
    // plus anything after an already-present closing marker.
    std::string open_marker(size_t pos);

    // Scan hidden_buffer_ for the closing marker; returns the visible text
    // around the buffered pairs.
    std::string try_close();

    // True when pending_ ends with a proper prefix of the opening marker.
    bool ends_with_open_prefix() const;

    MarkerConfig config_;
    Mode mode_ = Mode::Detecting;
    std::string pending_;       // undecided prefix of the stream
    std::string hidden_buffer_; // open marker onwards, until it closes
    std::optional<std::string> hidden_;
};

} // namespace agentstream
