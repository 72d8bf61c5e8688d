#pragma once
#include <string>
#include <vector>
#include <optional>

namespace stepstream {

// One server-sent frame. Fields are absent when the frame had no such line.
struct SSEFrame {
    std::optional<std::string> id;    // resumption cursor ("id:")
    std::optional<std::string> event; // event name ("event:")
    std::optional<std::string> data;  // "data:" lines joined with '\n'
};

// Incremental parser for a text/event-stream body. Frames end at a blank
// line; a trailing partial frame is kept until the next feed().
class FrameParser {
public:
    // Feed a raw chunk, returns every frame completed by it (possibly none)
    std::vector<SSEFrame> feed(const char* data, size_t len);
    std::vector<SSEFrame> feed(const std::string& chunk);

    // Frame still pending when the stream ended without a final blank line
    std::optional<SSEFrame> flush();

    // Reset parser state
    void reset();

private:
    void consume_line(const std::string& line, std::vector<SSEFrame>& out);
    bool has_pending() const;

    std::string buffer_;
    SSEFrame pending_;
    std::vector<std::string> data_lines_;
};

} // namespace stepstream
