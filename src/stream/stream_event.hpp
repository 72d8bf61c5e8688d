#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepstream {

namespace event_types {
    constexpr const char* StepStarted       = "step_started";
    constexpr const char* SubagentResult    = "subagent_result";
    constexpr const char* PlanStepCompleted = "plan_step_completed";
} // namespace event_types

// One planner event as delivered by the server. Never modified once built;
// `sequence` is its identity within a (session, plan step).
struct StreamEvent {
    std::string session_id;
    std::string plan_step_id;
    int64_t sequence = 0;
    std::string type;
    std::string timestamp;
    nlohmann::json content = nlohmann::json::object();
    nlohmann::json telemetry = nlohmann::json::object();

    bool operator==(const StreamEvent& other) const {
        return sequence == other.sequence && type == other.type &&
               session_id == other.session_id && plan_step_id == other.plan_step_id &&
               timestamp == other.timestamp && content == other.content &&
               telemetry == other.telemetry;
    }
    bool operator!=(const StreamEvent& other) const { return !(*this == other); }
};

// A stage the planner announced up front (step_started or caller supplied).
struct ExpectedSubagent {
    std::string key;
    std::optional<std::string> result_key;
};

struct SubagentState {
    std::string key;
    std::string status = "pending";
    std::optional<std::string> result_key;
    std::optional<nlohmann::json> payload;
    std::optional<int64_t> revision;
    std::string last_updated;
    std::optional<nlohmann::json> telemetry;
    std::optional<int64_t> sequence; // last event applied to this stage

    bool operator==(const SubagentState& other) const {
        return key == other.key && status == other.status &&
               result_key == other.result_key && payload == other.payload &&
               revision == other.revision && last_updated == other.last_updated &&
               telemetry == other.telemetry && sequence == other.sequence;
    }
    bool operator!=(const SubagentState& other) const { return !(*this == other); }
};

// Projection of the event log for one subscription.
//
// planner_context is tri-state: nullopt = never set, json null = explicitly
// cleared, object = current context. The *_sequence fields hold the sequence
// of the event that last wrote the matching field; older events never
// overwrite it.
struct StreamSummary {
    std::vector<StreamEvent> events; // ascending by sequence, no duplicates
    std::unordered_map<std::string, SubagentState> subagents_by_key;
    std::vector<std::string> subagent_order;
    std::optional<nlohmann::json> planner_context;
    std::optional<std::string> step_status;
    std::optional<nlohmann::json> completed_payload;
    std::optional<int64_t> last_sequence;
    std::optional<int64_t> context_sequence;
    std::optional<int64_t> status_sequence;
    std::optional<int64_t> completed_sequence;

    bool operator==(const StreamSummary& other) const {
        return events == other.events && subagents_by_key == other.subagents_by_key &&
               subagent_order == other.subagent_order &&
               planner_context == other.planner_context &&
               step_status == other.step_status &&
               completed_payload == other.completed_payload &&
               last_sequence == other.last_sequence &&
               context_sequence == other.context_sequence &&
               status_sequence == other.status_sequence &&
               completed_sequence == other.completed_sequence;
    }
    bool operator!=(const StreamSummary& other) const { return !(*this == other); }
};

} // namespace stepstream
