#include "normalizer.hpp"
#include "../util.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <cstdlib>

namespace stepstream {

using json = nlohmann::json;

static const char* kDefaultStreamError = "Planner stream reported an error";

// First field that is present and not null, or nullptr.
static const json* first_present(const json& obj, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = obj.find(name);
        if (it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Identifiers arrive as strings but some producers send numbers.
static std::string id_string(const json* value) {
    if (!value) return {};
    if (value->is_string()) return value->get<std::string>();
    if (value->is_number()) return value->dump();
    return {};
}

static std::optional<int64_t> parse_sequence(const json* value) {
    if (!value) return std::nullopt;
    if (value->is_number_unsigned()) {
        auto v = value->get<uint64_t>();
        if (v > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
        return static_cast<int64_t>(v);
    }
    if (value->is_number_integer()) {
        auto v = value->get<int64_t>();
        if (v < 0) return std::nullopt;
        return v;
    }
    if (value->is_number_float()) {
        double d = value->get<double>();
        if (!std::isfinite(d) || d < 0 || d != std::floor(d) || d > 9.0e18) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (value->is_string()) {
        std::string s = trim(value->get<std::string>());
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0' || v < 0) return std::nullopt;
        return static_cast<int64_t>(v);
    }
    return std::nullopt;
}

std::optional<StreamEvent> normalize_event(const json& value) {
    if (!value.is_object()) return std::nullopt;

    auto sequence = parse_sequence(first_present(value, {"sequence", "seq", "id"}));
    if (!sequence) return std::nullopt;

    StreamEvent event;
    event.plan_step_id = id_string(first_present(value, {"plan_step_id", "planStepId"}));
    if (event.plan_step_id.empty()) return std::nullopt;

    event.session_id = id_string(first_present(value, {"session_id", "sessionId"}));
    event.sequence = *sequence;
    event.type = id_string(first_present(value, {"type"}));

    auto ts = value.find("timestamp");
    if (ts != value.end() && ts->is_string() && !ts->get_ref<const std::string&>().empty())
        event.timestamp = ts->get<std::string>();
    else
        event.timestamp = timestamp_now();

    auto content = value.find("content");
    if (content != value.end() && content->is_object()) event.content = *content;
    auto telemetry = value.find("telemetry");
    if (telemetry != value.end() && telemetry->is_object()) event.telemetry = *telemetry;
    return event;
}

static std::string error_message(const std::optional<std::string>& data) {
    if (!data || data->empty()) return kDefaultStreamError;

    json parsed;
    try {
        parsed = json::parse(*data);
    } catch (const std::exception&) {
        return *data; // plain-text error
    }
    if (parsed.is_string()) {
        const auto& s = parsed.get_ref<const std::string&>();
        return s.empty() ? kDefaultStreamError : s;
    }
    if (parsed.is_object()) {
        auto it = parsed.find("message");
        if (it != parsed.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            return it->get<std::string>();
    }
    return kDefaultStreamError;
}

NormalizedFrame normalize_frame(const SSEFrame& frame) {
    NormalizedFrame result;
    if (!frame.event) return result;

    const std::string& name = *frame.event;
    if (name == frame_names::Heartbeat) {
        result.kind = FrameKind::Heartbeat;
        return result;
    }
    if (name == frame_names::Error) {
        result.kind = FrameKind::Error;
        result.error = error_message(frame.data);
        return result;
    }
    if (name != frame_names::PlannerStream || !frame.data) return result;

    json payload;
    try {
        payload = json::parse(*frame.data);
    } catch (const std::exception&) {
        return result;
    }
    if (!payload.is_object()) return result;
    auto type = payload.find("type");
    if (type == payload.end() || !type->is_string() || *type != "event_batch") return result;

    result.kind = FrameKind::Events;
    auto events = payload.find("events");
    if (events == payload.end() || !events->is_array()) return result;

    for (const auto& item : *events) {
        if (auto event = normalize_event(item)) {
            result.events.push_back(std::move(*event));
        }
    }
    return result;
}

} // namespace stepstream
