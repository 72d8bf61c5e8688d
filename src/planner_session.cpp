#include "planner_session.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "planner_api.hpp"
#include "util.hpp"
#include "stream/normalizer.hpp"
#include "stream/projector.hpp"

#include <iostream>

namespace stepstream {

PlannerSessionOptions PlannerSessionOptions::from_config(const Config& config) {
    PlannerSessionOptions options;
    options.base_url = config.base_url;
    options.context_headers = auth_headers(config.auth);
    options.reconnect.base_delay = std::chrono::milliseconds(config.stream.reconnect_base_ms);
    options.reconnect.max_delay = std::chrono::milliseconds(config.stream.reconnect_max_ms);
    options.reconnect.max_attempts = config.stream.max_attempts;
    options.connect_timeout = static_cast<long>(config.stream.connect_timeout);
    options.stop_on_completion = config.stream.stop_on_completion;
    return options;
}

PlannerSession::PlannerSession(HttpClient& http, PlannerSessionOptions options)
    : options_(std::move(options)),
      summary_(std::make_shared<const StreamSummary>()),
      connection_(http, options_.reconnect, options_.connect_timeout)
{
    connection_.set_state_handler([this](ConnectionState state, const std::string& error) {
        handle_state(state, error);
    });
}

PlannerSession::~PlannerSession() {
    connection_.stop();
}

void PlannerSession::set_target(const StreamTarget& target) {
    bool identity_changed = false;
    bool was_enabled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        identity_changed = !has_target_ ||
                           target.session_id != target_.session_id ||
                           target.plan_step_id != target_.plan_step_id;
        was_enabled = target_.enabled;
    }

    if (identity_changed) {
        // The old reader must be gone before its subscription state is reset.
        connection_.stop();

        std::lock_guard<std::mutex> lock(mutex_);
        has_target_ = true;
        target_ = target;
        ++subscription_;
        summary_ = std::make_shared<const StreamSummary>(
            reset_summary(target.expected.value_or(std::vector<ExpectedSubagent>{}),
                          target.planner_context));
        state_ = ConnectionState::Idle;
        error_.reset();
        replay_complete_ = false;
        last_heartbeat_at_.reset();
        last_event_id_.reset();
        completion_notified_ = false;
    } else {
        hydrate(target.expected, target.planner_context);
        std::lock_guard<std::mutex> lock(mutex_);
        target_.enabled = target.enabled;
        target_.initial_cursor = target.initial_cursor;
        if (was_enabled == target.enabled) return;
    }

    bool active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active = can_connect_locked();
    }
    if (active) {
        connect();
    } else {
        connection_.stop();
    }
}

void PlannerSession::hydrate(const std::optional<std::vector<ExpectedSubagent>>& expected,
                             const std::optional<nlohmann::json>& planner_context) {
    if (!expected && !planner_context) return;
    std::lock_guard<std::mutex> lock(mutex_);
    summary_ = std::make_shared<const StreamSummary>(
        hydrate_expected(*summary_, expected.value_or(std::vector<ExpectedSubagent>{}),
                         planner_context));
}

void PlannerSession::stop() {
    connection_.stop();
}

void PlannerSession::restart() {
    bool active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active = can_connect_locked();
    }
    if (!active) return;
    connection_.stop();
    connect();
}

bool PlannerSession::can_connect_locked() const {
    return has_target_ && target_.enabled &&
           !target_.session_id.empty() && !target_.plan_step_id.empty();
}

void PlannerSession::connect() {
    uint64_t subscription = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription = subscription_;
    }
    connection_.start(
        [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            StreamRequest request;
            request.url = build_stream_url(options_.base_url, target_.session_id,
                                           target_.plan_step_id);
            request.headers = stream_headers(options_.context_headers, cursor_locked());
            return request;
        },
        [this, subscription](const SSEFrame& frame) {
            handle_frame(subscription, frame);
        });
}

void PlannerSession::handle_state(ConnectionState state, const std::string& error) {
    ConnectionStateChangedEvent ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        if (state == ConnectionState::Error && !error.empty()) error_ = error;
        else if (state == ConnectionState::Open) error_.reset();
        ev.session_id = target_.session_id;
        ev.plan_step_id = target_.plan_step_id;
    }
    ev.state = state;
    ev.error = error;
    if (!options_.bus) return;
    options_.bus->publish(ev);
    if (state == ConnectionState::Error && !error.empty()) {
        StreamErrorEvent err;
        err.session_id = ev.session_id;
        err.plan_step_id = ev.plan_step_id;
        err.message = error;
        options_.bus->publish(err);
    }
}

void PlannerSession::handle_frame(uint64_t subscription, const SSEFrame& frame) {
    NormalizedFrame normalized = normalize_frame(frame);

    std::string session_id, plan_step_id;
    bool summary_changed = false;
    bool completed = false;
    std::shared_ptr<const StreamSummary> summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscription != subscription_) return;

        if (frame.id && !frame.id->empty()) last_event_id_ = *frame.id;

        switch (normalized.kind) {
            case FrameKind::Heartbeat:
                last_heartbeat_at_ = timestamp_now();
                replay_complete_ = true;
                break;
            case FrameKind::Error:
                error_ = normalized.error;
                state_ = ConnectionState::Error;
                break;
            case FrameKind::Events:
                if (!normalized.events.empty()) {
                    summary_ = std::make_shared<const StreamSummary>(
                        apply_events(*summary_, normalized.events));
                    replay_complete_ = true;
                    summary_changed = true;
                }
                break;
            case FrameKind::Ignored:
                break;
        }

        if (!completion_notified_ && is_terminal_status(summary_->step_status)) {
            completion_notified_ = true;
            completed = true;
        }
        summary = summary_;
        session_id = target_.session_id;
        plan_step_id = target_.plan_step_id;
    }

    if (normalized.kind == FrameKind::Error) {
        std::cerr << "[session] Planner stream error for " << plan_step_id << ": "
                  << normalized.error << '\n';
        if (options_.bus) {
            StreamErrorEvent err;
            err.session_id = session_id;
            err.plan_step_id = plan_step_id;
            err.message = normalized.error;
            options_.bus->publish(err);
            ConnectionStateChangedEvent state;
            state.session_id = session_id;
            state.plan_step_id = plan_step_id;
            state.state = ConnectionState::Error;
            state.error = normalized.error;
            options_.bus->publish(state);
        }
    }

    if (summary_changed && options_.bus) {
        SummaryUpdatedEvent ev;
        ev.session_id = session_id;
        ev.plan_step_id = plan_step_id;
        ev.last_sequence = summary->last_sequence;
        ev.event_count = summary->events.size();
        ev.step_status = summary->step_status;
        options_.bus->publish(ev);
    }

    if (!completed) return;

    if (options_.stop_on_completion) connection_.stop();

    std::string status = summary->step_status.value_or("");
    if (options_.bus) {
        StepCompletedEvent ev;
        ev.session_id = session_id;
        ev.plan_step_id = plan_step_id;
        ev.status = status;
        ev.payload = summary->completed_payload;
        options_.bus->publish(ev);
    }
    if (options_.on_step_completed) {
        try {
            options_.on_step_completed(status, summary->completed_payload);
        } catch (const std::exception& e) {
            std::cerr << "[session] Step completion callback failed: " << e.what() << '\n';
        }
    }
}

std::optional<std::string> PlannerSession::cursor_locked() const {
    if (summary_->last_sequence) return std::to_string(*summary_->last_sequence);
    if (last_event_id_) return last_event_id_;
    return target_.initial_cursor;
}

ConnectionState PlannerSession::connection_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> PlannerSession::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool PlannerSession::retries_exhausted() const {
    return connection_.exhausted();
}

std::shared_ptr<const StreamSummary> PlannerSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

std::vector<SubagentState> PlannerSession::subagents() const {
    return ordered_subagents(*snapshot());
}

std::optional<std::string> PlannerSession::step_status() const {
    return snapshot()->step_status;
}

std::optional<nlohmann::json> PlannerSession::completed_payload() const {
    return snapshot()->completed_payload;
}

std::optional<nlohmann::json> PlannerSession::planner_context() const {
    return snapshot()->planner_context;
}

bool PlannerSession::replay_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay_complete_;
}

std::optional<std::string> PlannerSession::last_heartbeat_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_heartbeat_at_;
}

std::optional<std::string> PlannerSession::last_event_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_id_;
}

bool PlannerSession::is_terminal() const {
    return is_terminal_status(snapshot()->step_status);
}

std::optional<std::string> PlannerSession::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_locked();
}

} // namespace stepstream
