#include <catch2/catch.hpp>
#include "stream/connection.hpp"
#include "planner_api.hpp"
#include "mock_http_client.hpp"
#include <mutex>
#include <vector>

using namespace stepstream;
using namespace std::chrono_literals;

namespace {

ReconnectPolicy fast_policy(uint32_t max_attempts = 0) {
    ReconnectPolicy policy;
    policy.base_delay = 1ms;
    policy.max_delay = 4ms;
    policy.max_attempts = max_attempts;
    return policy;
}

// Records everything the manager reports.
struct Recorder {
    mutable std::mutex mutex;
    std::vector<ConnectionState> states;
    std::vector<std::string> errors;
    std::vector<SSEFrame> frames;

    void attach(ConnectionManager& manager) {
        manager.set_state_handler([this](ConnectionState state, const std::string& error) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
            if (state == ConnectionState::Error) errors.push_back(error);
        });
    }

    ConnectionManager::FrameHandler frame_handler() {
        return [this](const SSEFrame& frame) {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(frame);
        };
    }

    size_t frame_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }

    bool saw(ConnectionState state) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto s : states) {
            if (s == state) return true;
        }
        return false;
    }
};

ConnectionManager::RequestFactory fixed_request() {
    return [] {
        return StreamRequest{"http://planner/api/planner/sessions/s/stream?planStepId=p",
                             {{"Accept", "text/event-stream"}}};
    };
}

} // namespace

// ── Backoff ──────────────────────────────────────────────────────

TEST_CASE("backoff_delay: doubles per attempt up to the cap", "[connection]") {
    ReconnectPolicy policy;
    REQUIRE(backoff_delay(policy, 0) == 1000ms);
    REQUIRE(backoff_delay(policy, 1) == 2000ms);
    REQUIRE(backoff_delay(policy, 2) == 4000ms);
    REQUIRE(backoff_delay(policy, 3) == 8000ms);
    REQUIRE(backoff_delay(policy, 4) == 15000ms);
    REQUIRE(backoff_delay(policy, 1000) == 15000ms);
}

TEST_CASE("connection_state_name: lowercase names", "[connection]") {
    REQUIRE(std::string(connection_state_name(ConnectionState::Idle)) == "idle");
    REQUIRE(std::string(connection_state_name(ConnectionState::Reconnecting)) == "reconnecting");
    REQUIRE(std::string(connection_state_name(ConnectionState::Error)) == "error");
}

// ── Lifecycle ────────────────────────────────────────────────────

TEST_CASE("ConnectionManager: starts idle", "[connection]") {
    MockHttpClient http;
    ConnectionManager manager(http);
    REQUIRE(manager.state() == ConnectionState::Idle);
    manager.stop();
    REQUIRE(manager.state() == ConnectionState::Idle);
    REQUIRE(http.stream_call_count() == 0);
}

TEST_CASE("ConnectionManager: opens and delivers frames", "[connection]") {
    MockHttpClient http;
    ScriptedStream stream;
    stream.chunks = {"id: 1\nevent: heart", "beat\ndata: {}\n\nid: 2\nevent: planner_stream\n"
                     "data: {\"type\":\"event_batch\",\"events\":[]}\n\n"};
    stream.hold_open = true;
    http.push_stream(stream);

    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    rec.attach(manager);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(wait_until([&] { return rec.frame_count() == 2; }));
    REQUIRE(manager.state() == ConnectionState::Open);
    REQUIRE(rec.saw(ConnectionState::Connecting));
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        REQUIRE(rec.frames[0].event == "heartbeat");
        REQUIRE(rec.frames[1].id == "2");
    }

    manager.stop();
    REQUIRE(manager.state() == ConnectionState::Closed);
    REQUIRE(http.stream_call_count() == 1);
}

TEST_CASE("ConnectionManager: failures reconnect with backoff", "[connection]") {
    MockHttpClient http;
    ScriptedStream refused;
    refused.status = 0;
    ScriptedStream unavailable;
    unavailable.status = 503;
    http.push_stream(refused);
    http.push_stream(unavailable);

    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    rec.attach(manager);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(http.wait_for_stream_calls(3));
    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Open; }));
    REQUIRE(rec.saw(ConnectionState::Reconnecting));
    REQUIRE(manager.attempt() == 0);
    REQUIRE(manager.last_error().empty());
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        REQUIRE(rec.errors.size() == 2);
        REQUIRE(rec.errors[0] == "Planner stream connection failed");
        REQUIRE(rec.errors[1] == "Planner stream failed with status 503");
    }
    manager.stop();
}

TEST_CASE("ConnectionManager: connection lost mid-stream reports an error", "[connection]") {
    MockHttpClient http;
    ScriptedStream dropped;
    dropped.chunks = {"event: heartbeat\ndata: {}\n\n"};
    dropped.fail_after_chunks = true;
    http.push_stream(dropped);

    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    rec.attach(manager);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(http.wait_for_stream_calls(2));
    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Open; }));
    REQUIRE(rec.frame_count() == 1);
    REQUIRE_FALSE(rec.saw(ConnectionState::Closed));
    REQUIRE(rec.saw(ConnectionState::Reconnecting));
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        REQUIRE(rec.errors.size() == 1);
        REQUIRE(rec.errors[0] == "Planner stream connection failed");
    }
    manager.stop();
}

TEST_CASE("ConnectionManager: mid-stream failure keeps the error once retries run out", "[connection]") {
    MockHttpClient http;
    ScriptedStream dropped;
    dropped.fail_after_chunks = true;
    ScriptedStream refused;
    refused.status = 0;
    http.push_stream(dropped);
    http.push_stream(refused);

    ConnectionManager manager(http, fast_policy(1));
    manager.start(fixed_request(), [](const SSEFrame&) {});

    REQUIRE(http.wait_for_stream_calls(2));
    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Error; }));
    REQUIRE(manager.last_error() == "Planner stream connection failed");
    manager.stop();
}

TEST_CASE("ConnectionManager: reconnect asks for a fresh cursor", "[connection]") {
    MockHttpClient http;
    ScriptedStream first;
    first.chunks = {"id: 12\nevent: planner_stream\ndata: {}\n\n"};
    http.push_stream(first); // server closes after one frame

    std::mutex cursor_mutex;
    std::optional<std::string> cursor;

    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    rec.attach(manager);
    manager.start(
        [&] {
            std::lock_guard<std::mutex> lock(cursor_mutex);
            return StreamRequest{"http://planner/stream", stream_headers({}, cursor)};
        },
        [&](const SSEFrame& frame) {
            std::lock_guard<std::mutex> lock(cursor_mutex);
            cursor = frame.id;
        });

    REQUIRE(http.wait_for_stream_calls(2));
    REQUIRE_FALSE(find_header(http.stream_headers(0), "Last-Event-ID").has_value());
    REQUIRE(find_header(http.stream_headers(1), "Last-Event-ID") == "12");
    REQUIRE(rec.saw(ConnectionState::Closed));
    REQUIRE(rec.saw(ConnectionState::Reconnecting));
    manager.stop();
}

TEST_CASE("ConnectionManager: gives up after max_attempts", "[connection]") {
    MockHttpClient http;
    ScriptedStream refused;
    refused.status = 0;
    for (int i = 0; i < 5; ++i) http.push_stream(refused);

    Recorder rec;
    ConnectionManager manager(http, fast_policy(2));
    rec.attach(manager);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(http.wait_for_stream_calls(3));
    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Error; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(http.stream_call_count() == 3);
    REQUIRE(manager.state() == ConnectionState::Error);
    REQUIRE(manager.last_error() == "Planner stream connection failed");
    manager.stop();
}

TEST_CASE("ConnectionManager: stop interrupts a pending backoff", "[connection]") {
    MockHttpClient http;
    ScriptedStream refused;
    refused.status = 0;
    http.push_stream(refused);

    ReconnectPolicy slow;
    slow.base_delay = 10s;
    slow.max_delay = 10s;
    Recorder rec;
    ConnectionManager manager(http, slow);
    rec.attach(manager);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Reconnecting; }));
    auto begin = std::chrono::steady_clock::now();
    manager.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < 2s);
    REQUIRE(manager.state() == ConnectionState::Closed);
    REQUIRE(http.stream_call_count() == 1);
}

TEST_CASE("ConnectionManager: restart replaces the previous stream", "[connection]") {
    MockHttpClient http;
    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    rec.attach(manager);

    manager.start(fixed_request(), rec.frame_handler());
    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Open; }));

    ScriptedStream second;
    second.chunks = {"event: heartbeat\ndata: {}\n\n"};
    second.hold_open = true;
    http.push_stream(second);
    manager.start(fixed_request(), rec.frame_handler());

    REQUIRE(wait_until([&] { return rec.frame_count() == 1; }));
    REQUIRE(http.stream_call_count() == 2);
    manager.stop();
    REQUIRE(manager.state() == ConnectionState::Closed);
}

TEST_CASE("ConnectionManager: stop from a frame handler drops later frames", "[connection]") {
    MockHttpClient http;
    ScriptedStream stream;
    stream.chunks = {"event: heartbeat\ndata: 1\n\n", "event: heartbeat\ndata: 2\n\n"};
    stream.hold_open = true;
    http.push_stream(stream);

    ConnectionManager manager(http, fast_policy());
    std::atomic<int> delivered{0};
    manager.start(fixed_request(), [&](const SSEFrame&) {
        delivered++;
        manager.stop();
    });

    REQUIRE(wait_until([&] { return manager.state() == ConnectionState::Closed; }));
    std::this_thread::sleep_for(20ms);
    REQUIRE(delivered.load() == 1);
    REQUIRE(http.stream_call_count() == 1);
}

TEST_CASE("ConnectionManager: nothing is delivered after stop returns", "[connection]") {
    MockHttpClient http;
    ScriptedStream stream;
    for (int i = 0; i < 200; ++i) stream.chunks.push_back("event: heartbeat\ndata: {}\n\n");
    stream.hold_open = true;
    http.push_stream(stream);

    Recorder rec;
    ConnectionManager manager(http, fast_policy());
    manager.start(fixed_request(), rec.frame_handler());
    REQUIRE(wait_until([&] { return rec.frame_count() > 0; }));

    manager.stop();
    size_t after_stop = rec.frame_count();
    std::this_thread::sleep_for(20ms);
    REQUIRE(rec.frame_count() == after_stop);
}
