#include "frame_parser.hpp"
#include "../util.hpp"

namespace stepstream {

std::vector<SSEFrame> FrameParser::feed(const std::string& chunk) {
    return feed(chunk.data(), chunk.size());
}

std::vector<SSEFrame> FrameParser::feed(const char* data, size_t len) {
    buffer_.append(data, len);

    std::vector<SSEFrame> frames;
    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line

        std::string line = buffer_.substr(pos, newline - pos);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;
        consume_line(line, frames);
    }
    buffer_.erase(0, pos);
    return frames;
}

void FrameParser::consume_line(const std::string& line, std::vector<SSEFrame>& out) {
    if (line.empty()) {
        // Empty line = dispatch frame
        if (has_pending()) {
            SSEFrame frame = std::move(pending_);
            if (!data_lines_.empty()) {
                std::string joined;
                for (size_t i = 0; i < data_lines_.size(); ++i) {
                    if (i > 0) joined += '\n';
                    joined += data_lines_[i];
                }
                frame.data = std::move(joined);
            }
            out.push_back(std::move(frame));
        }
        pending_ = SSEFrame{};
        data_lines_.clear();
        return;
    }

    if (line.rfind("id:", 0) == 0) {
        pending_.id = trim(line.substr(3));
    } else if (line.rfind("event:", 0) == 0) {
        pending_.event = trim(line.substr(6));
    } else if (line.rfind("data:", 0) == 0) {
        // Handle both "data: payload" (with space) and "data:payload" (without)
        data_lines_.push_back(line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5));
    }
    // Ignore other lines (comments starting with :, unknown fields)
}

bool FrameParser::has_pending() const {
    return pending_.id || pending_.event || !data_lines_.empty();
}

std::optional<SSEFrame> FrameParser::flush() {
    std::vector<SSEFrame> frames;
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        consume_line(line, frames);
    }
    consume_line("", frames);
    if (frames.empty()) return std::nullopt;
    return std::move(frames.front());
}

void FrameParser::reset() {
    buffer_.clear();
    pending_ = SSEFrame{};
    data_lines_.clear();
}

} // namespace stepstream
