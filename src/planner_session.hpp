#pragma once
#include "config.hpp"
#include "http.hpp"
#include "stream/connection.hpp"
#include "stream/frame_parser.hpp"
#include "stream/stream_event.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepstream {

class EventBus; // forward declaration

using StepCompletedCallback =
    std::function<void(const std::string& status, const std::optional<nlohmann::json>& payload)>;

struct PlannerSessionOptions {
    std::string base_url;
    std::vector<Header> context_headers; // auth/device/timezone, forwarded as-is
    ReconnectPolicy reconnect;
    long connect_timeout = 30;
    bool stop_on_completion = true;
    StepCompletedCallback on_step_completed;
    EventBus* bus = nullptr; // optional, not owned

    static PlannerSessionOptions from_config(const Config& config);
};

// What the caller wants to watch. expected / planner_context are optional
// hydration hints; nullopt means "not supplied".
struct StreamTarget {
    std::string session_id;
    std::string plan_step_id;
    bool enabled = true;
    std::optional<std::string> initial_cursor;
    std::optional<std::vector<ExpectedSubagent>> expected;
    std::optional<nlohmann::json> planner_context;
};

// Live view of one planner step. Owns the connection, folds normalized
// events into an immutable StreamSummary and reports completion once.
//
// All accessors are thread-safe; frames are applied on the connection's
// worker thread.
class PlannerSession {
public:
    PlannerSession(HttpClient& http, PlannerSessionOptions options);
    ~PlannerSession();

    PlannerSession(const PlannerSession&) = delete;
    PlannerSession& operator=(const PlannerSession&) = delete;

    // A new (session, plan step) pair resets everything and reconnects.
    // The same pair only merges hydration hints and applies `enabled`.
    void set_target(const StreamTarget& target);

    // Merge stages/context learned after the subscription started.
    void hydrate(const std::optional<std::vector<ExpectedSubagent>>& expected,
                 const std::optional<nlohmann::json>& planner_context);

    // Cancel the stream and any pending reconnect. Once this returns no
    // further frame is applied and the completion callback cannot fire.
    void stop();

    // stop() followed by a fresh connection for the current target.
    void restart();

    ConnectionState connection_state() const;
    std::optional<std::string> error() const;
    // The reconnect limit was reached; nothing reconnects until restart().
    bool retries_exhausted() const;
    std::shared_ptr<const StreamSummary> snapshot() const;
    std::vector<SubagentState> subagents() const;
    std::optional<std::string> step_status() const;
    std::optional<nlohmann::json> completed_payload() const;
    std::optional<nlohmann::json> planner_context() const;
    bool replay_complete() const;
    std::optional<std::string> last_heartbeat_at() const;
    std::optional<std::string> last_event_id() const;
    bool is_terminal() const;

    // Cursor the next (re)connection will send as Last-Event-ID.
    std::optional<std::string> cursor() const;

private:
    void connect();
    void handle_frame(uint64_t subscription, const SSEFrame& frame);
    void handle_state(ConnectionState state, const std::string& error);
    std::optional<std::string> cursor_locked() const;
    bool can_connect_locked() const;

    PlannerSessionOptions options_;

    mutable std::mutex mutex_;
    StreamTarget target_;
    bool has_target_ = false;
    uint64_t subscription_ = 0;
    std::shared_ptr<const StreamSummary> summary_;
    ConnectionState state_ = ConnectionState::Idle;
    std::optional<std::string> error_;
    bool replay_complete_ = false;
    std::optional<std::string> last_heartbeat_at_;
    std::optional<std::string> last_event_id_;
    bool completion_notified_ = false;

    // Declared last: its worker calls back into the members above.
    ConnectionManager connection_;
};

} // namespace stepstream
