#pragma once
#include "stream/connection.hpp"
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepstream {

// Tag-based event dispatch (no RTTI, no dynamic_cast).
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ConnectionStateChanged = "ConnectionStateChanged";
    constexpr const char* StreamError            = "StreamError";
    constexpr const char* SummaryUpdated         = "SummaryUpdated";
    constexpr const char* StepCompleted          = "StepCompleted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct ConnectionStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectionStateChanged;
    std::string session_id;
    std::string plan_step_id;
    ConnectionState state = ConnectionState::Idle;
    std::string error;

    ConnectionStateChangedEvent() { type_tag = TAG; }
};

// Server-sent `error` frame, or a failed or dropped connection.
struct StreamErrorEvent : Event {
    static constexpr const char* TAG = event_tags::StreamError;
    std::string session_id;
    std::string plan_step_id;
    std::string message;

    StreamErrorEvent() { type_tag = TAG; }
};

struct SummaryUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::SummaryUpdated;
    std::string session_id;
    std::string plan_step_id;
    std::optional<int64_t> last_sequence;
    size_t event_count = 0;
    std::optional<std::string> step_status;

    SummaryUpdatedEvent() { type_tag = TAG; }
};

struct StepCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::StepCompleted;
    std::string session_id;
    std::string plan_step_id;
    std::string status;
    std::optional<nlohmann::json> payload;

    StepCompletedEvent() { type_tag = TAG; }
};

} // namespace stepstream
