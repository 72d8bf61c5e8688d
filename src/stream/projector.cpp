#include "projector.hpp"
#include "../util.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <unordered_set>

namespace stepstream {

using json = nlohmann::json;

namespace {

const json* first_present(const json& obj, std::initializer_list<const char*> names) {
    if (!obj.is_object()) return nullptr;
    for (const char* name : names) {
        auto it = obj.find(name);
        if (it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

std::optional<std::string> string_field(const json& obj, const char* name) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Stage keys and result keys: strings as-is, numbers stringified.
std::optional<std::string> key_string(const json* value) {
    if (!value) return std::nullopt;
    if (value->is_string()) {
        const auto& s = value->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (value->is_number()) return value->dump();
    return std::nullopt;
}

// Revisions: integers, or floats with no fractional part.
std::optional<int64_t> integral_value(const json& value) {
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || d != std::floor(d) || std::fabs(d) > 9.0e18) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

bool newer_than(const std::optional<int64_t>& written, int64_t sequence) {
    return !written || sequence > *written;
}

// A higher revision is never replaced by a lower one; otherwise the later
// sequence wins.
bool supersedes(const SubagentState& prior, int64_t sequence,
                const std::optional<int64_t>& revision) {
    if (prior.revision && revision && *revision != *prior.revision)
        return *revision > *prior.revision;
    return newer_than(prior.sequence, sequence);
}

void set_step_status(StreamSummary& next, const StreamEvent& event, const std::string& status) {
    if (!newer_than(next.status_sequence, event.sequence)) return;
    next.step_status = status;
    next.status_sequence = event.sequence;
}

void ensure_order_includes(std::vector<std::string>& order, const std::string& key) {
    if (std::find(order.begin(), order.end(), key) == order.end()) {
        order.push_back(key);
    }
}

void merge_expected(StreamSummary& summary,
                    const std::vector<ExpectedSubagent>& expected,
                    const std::string& timestamp) {
    if (expected.empty()) return;

    std::unordered_map<std::string, SubagentState> next_by_key;
    std::vector<std::string> next_order;
    const auto& existing = summary.subagents_by_key;

    for (const auto& item : expected) {
        if (item.key.empty()) continue;
        if (next_by_key.count(item.key)) continue;
        next_order.push_back(item.key);

        auto prior = existing.find(item.key);
        if (prior == existing.end()) {
            SubagentState state;
            state.key = item.key;
            state.result_key = item.result_key;
            state.last_updated = timestamp;
            next_by_key.emplace(item.key, std::move(state));
            continue;
        }
        SubagentState state = prior->second;
        if (item.result_key) state.result_key = item.result_key;
        next_by_key.emplace(item.key, std::move(state));
    }

    for (const auto& key : summary.subagent_order) {
        if (next_by_key.count(key)) continue;
        auto it = existing.find(key);
        if (it == existing.end()) continue;
        next_by_key.emplace(key, it->second);
        next_order.push_back(key);
    }

    summary.subagents_by_key = std::move(next_by_key);
    summary.subagent_order = std::move(next_order);
}

void apply_step_started(StreamSummary& next, const StreamEvent& event) {
    const json& content = event.content;

    const json* expected_raw = first_present(content, {"expected_subagents", "expectedSubagents"});
    std::vector<ExpectedSubagent> expected;
    if (expected_raw) expected = parse_expected_subagents(*expected_raw);

    // An explicit null clears the context; non-object values are ignored.
    const json* context = nullptr;
    for (const char* name : {"planner_context", "plannerContext"}) {
        auto it = content.find(name);
        if (it == content.end()) continue;
        context = &*it;
        if (!it->is_null()) break;
    }
    if (context && (context->is_object() || context->is_null()) &&
        newer_than(next.context_sequence, event.sequence)) {
        next.planner_context = *context;
        next.context_sequence = event.sequence;
    }

    if (auto status = string_field(content, "status")) set_step_status(next, event, *status);

    merge_expected(next, expected, event.timestamp.empty() ? timestamp_now() : event.timestamp);
}

void apply_subagent_result(StreamSummary& next, const StreamEvent& event) {
    const json& content = event.content;

    if (auto key = key_string(first_present(content, {"stage", "subagent", "key"}))) {
        ensure_order_includes(next.subagent_order, *key);

        std::optional<int64_t> revision;
        auto revision_it = content.find("revision");
        if (revision_it != content.end()) revision = integral_value(*revision_it);

        SubagentState state;
        auto prior = next.subagents_by_key.find(*key);
        if (prior != next.subagents_by_key.end()) state = prior->second;
        state.key = *key;
        bool stale = prior != next.subagents_by_key.end() &&
                     !supersedes(prior->second, event.sequence, revision);
        if (!stale) {
            if (auto status = string_field(content, "status")) state.status = *status;

            if (auto result_key = key_string(first_present(content, {"resultKey", "result_key"})))
                state.result_key = *result_key;

            auto payload = content.find("payload");
            if (payload != content.end() && (payload->is_object() || payload->is_array()))
                state.payload = *payload;

            if (revision) state.revision = revision;

            if (event.telemetry.is_object() && !event.telemetry.empty())
                state.telemetry = event.telemetry;

            state.last_updated = event.timestamp.empty() ? timestamp_now() : event.timestamp;
            state.sequence = event.sequence;
            next.subagents_by_key[*key] = std::move(state);
        }
    }

    // overall_status takes precedence over the stage's own status.
    auto overall = content.find("overall_status");
    if (overall != content.end() && !overall->is_null()) {
        if (overall->is_string()) set_step_status(next, event, overall->get<std::string>());
        return;
    }
    if (auto status = string_field(content, "status")) set_step_status(next, event, *status);
}

void apply_plan_step_completed(StreamSummary& next, const StreamEvent& event) {
    if (auto status = string_field(event.content, "status")) set_step_status(next, event, *status);
    auto payload = event.content.find("payload");
    if (payload != event.content.end() && (payload->is_object() || payload->is_array()) &&
        newer_than(next.completed_sequence, event.sequence)) {
        next.completed_payload = *payload;
        next.completed_sequence = event.sequence;
    }
}

} // namespace

StreamSummary apply_events(const StreamSummary& summary,
                           const std::vector<StreamEvent>& events) {
    if (events.empty()) return summary;

    std::unordered_set<int64_t> seen;
    seen.reserve(summary.events.size() + events.size());
    for (const auto& e : summary.events) seen.insert(e.sequence);

    std::vector<const StreamEvent*> fresh;
    fresh.reserve(events.size());
    for (const auto& event : events) {
        if (seen.insert(event.sequence).second) fresh.push_back(&event);
    }
    if (fresh.empty()) return summary;

    std::stable_sort(fresh.begin(), fresh.end(),
                     [](const StreamEvent* a, const StreamEvent* b) {
                         return a->sequence < b->sequence;
                     });

    StreamSummary next = summary;
    for (const StreamEvent* event : fresh) {
        next.events.push_back(*event);
        if (!next.last_sequence || event->sequence > *next.last_sequence)
            next.last_sequence = event->sequence;

        if (event->type == event_types::StepStarted) {
            apply_step_started(next, *event);
        } else if (event->type == event_types::SubagentResult) {
            apply_subagent_result(next, *event);
        } else if (event->type == event_types::PlanStepCompleted) {
            apply_plan_step_completed(next, *event);
        } else if (auto status = string_field(event->content, "status")) {
            set_step_status(next, *event, *status);
        }
    }

    std::stable_sort(next.events.begin(), next.events.end(),
                     [](const StreamEvent& a, const StreamEvent& b) {
                         return a.sequence < b.sequence;
                     });
    return next;
}

StreamSummary reset_summary(const std::vector<ExpectedSubagent>& expected,
                            const std::optional<json>& planner_context) {
    StreamSummary base;
    if (planner_context && (planner_context->is_object() || planner_context->is_null()))
        base.planner_context = planner_context;
    merge_expected(base, expected, timestamp_now());
    return base;
}

StreamSummary hydrate_expected(const StreamSummary& summary,
                               const std::vector<ExpectedSubagent>& expected,
                               const std::optional<json>& planner_context) {
    StreamSummary next = summary;
    merge_expected(next, expected, timestamp_now());
    if (planner_context && (planner_context->is_object() || planner_context->is_null()))
        next.planner_context = planner_context;
    return next;
}

std::vector<ExpectedSubagent> parse_expected_subagents(const json& value) {
    std::vector<ExpectedSubagent> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (!item.is_object()) continue;
        const json* key = first_present(item, {"key", "subagent", "stage"});
        if (!key || !key->is_string() || key->get_ref<const std::string&>().empty()) continue;
        ExpectedSubagent expected;
        expected.key = key->get<std::string>();
        expected.result_key = key_string(first_present(item, {"resultKey", "result_key"}));
        out.push_back(std::move(expected));
    }
    return out;
}

bool is_terminal_status(const std::string& status) {
    static const std::array<const char*, 10> kTerminal = {
        "success", "completed", "complete", "error", "failed",
        "failure", "cancelled", "timeout", "partial_failure", "degraded",
    };
    std::string normalized = to_lower(trim(status));
    if (normalized.empty()) return false;
    for (const char* t : kTerminal) {
        if (normalized == t) return true;
    }
    return false;
}

bool is_terminal_status(const std::optional<std::string>& status) {
    return status && is_terminal_status(*status);
}

std::vector<SubagentState> ordered_subagents(const StreamSummary& summary) {
    std::vector<SubagentState> out;
    out.reserve(summary.subagent_order.size());
    for (const auto& key : summary.subagent_order) {
        auto it = summary.subagents_by_key.find(key);
        if (it != summary.subagents_by_key.end()) out.push_back(it->second);
    }
    return out;
}

json to_json(const StreamEvent& event) {
    return {
        {"session_id", event.session_id},
        {"plan_step_id", event.plan_step_id},
        {"sequence", event.sequence},
        {"type", event.type},
        {"timestamp", event.timestamp},
        {"content", event.content},
        {"telemetry", event.telemetry}
    };
}

json to_json(const SubagentState& state) {
    json j = {
        {"key", state.key},
        {"status", state.status},
        {"last_updated", state.last_updated}
    };
    j["result_key"] = state.result_key ? json(*state.result_key) : json(nullptr);
    j["payload"] = state.payload ? *state.payload : json(nullptr);
    if (state.revision) j["revision"] = *state.revision;
    if (state.telemetry) j["telemetry"] = *state.telemetry;
    return j;
}

json to_json(const StreamSummary& summary) {
    json stages = json::array();
    for (const auto& state : ordered_subagents(summary)) stages.push_back(to_json(state));

    json events = json::array();
    for (const auto& event : summary.events) events.push_back(to_json(event));

    json j = {{"subagents", stages}, {"events", events}};
    j["planner_context"] = summary.planner_context ? *summary.planner_context : json(nullptr);
    j["step_status"] = summary.step_status ? json(*summary.step_status) : json(nullptr);
    j["completed_payload"] = summary.completed_payload ? *summary.completed_payload : json(nullptr);
    j["last_sequence"] = summary.last_sequence ? json(*summary.last_sequence) : json(nullptr);
    return j;
}

} // namespace stepstream
