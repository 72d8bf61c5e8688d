#pragma once
#include "frame_parser.hpp"
#include "stream_event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace stepstream {

namespace frame_names {
    constexpr const char* Heartbeat     = "heartbeat";
    constexpr const char* Error         = "error";
    constexpr const char* PlannerStream = "planner_stream";
} // namespace frame_names

enum class FrameKind {
    Ignored,   // unknown event name, non-batch payload, or unparseable data
    Heartbeat, // liveness only
    Error,     // server-reported stream error, see NormalizedFrame::error
    Events     // event_batch payload; `events` holds the elements that validated
};

struct NormalizedFrame {
    FrameKind kind = FrameKind::Ignored;
    std::string error;
    std::vector<StreamEvent> events;
};

// Classify a parsed frame and extract its planner events.
// Invalid batch elements are dropped; never throws.
NormalizedFrame normalize_frame(const SSEFrame& frame);

// Validate one wire event object (snake_case or camelCase fields).
// Returns nullopt when the sequence is missing/non-numeric or the
// plan step id is empty.
std::optional<StreamEvent> normalize_event(const nlohmann::json& value);

} // namespace stepstream
