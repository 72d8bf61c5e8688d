#pragma once
#include "stream_event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace stepstream {

// Fold a batch of events into a summary and return the result; `summary`
// itself is left untouched. Events whose sequence is already in the log
// (or earlier in the same batch) are skipped, so replaying is a no-op.
// New events of a batch are applied in sequence order and the resulting log
// is sorted by sequence. An unseen event older than the one that last wrote
// a stage (or the step status, context or completion payload) is logged but
// does not overwrite it, and a stage's higher revision is never replaced by a
// lower one.
StreamSummary apply_events(const StreamSummary& summary,
                           const std::vector<StreamEvent>& events);

// Fresh summary, hydrated with the caller's expected stages and context.
StreamSummary reset_summary(const std::vector<ExpectedSubagent>& expected,
                            const std::optional<nlohmann::json>& planner_context);

// Merge expected stages into an existing summary without touching applied
// events. Listed keys come first in listed order, followed by any other
// known keys. Existing stage state (status, payload, revision) is kept.
// planner_context: nullopt leaves it alone, null clears it, object sets it.
StreamSummary hydrate_expected(const StreamSummary& summary,
                               const std::vector<ExpectedSubagent>& expected,
                               const std::optional<nlohmann::json>& planner_context);

// Parse a JSON array of {key|subagent|stage, resultKey|result_key}.
// Non-object items and items without a string key are skipped.
std::vector<ExpectedSubagent> parse_expected_subagents(const nlohmann::json& value);

// Case-insensitive check against the terminal vocabulary (success,
// completed, error, failed, cancelled, timeout, ...).
bool is_terminal_status(const std::string& status);
bool is_terminal_status(const std::optional<std::string>& status);

// Stages in display order.
std::vector<SubagentState> ordered_subagents(const StreamSummary& summary);

nlohmann::json to_json(const StreamEvent& event);
nlohmann::json to_json(const SubagentState& state);
nlohmann::json to_json(const StreamSummary& summary);

} // namespace stepstream
