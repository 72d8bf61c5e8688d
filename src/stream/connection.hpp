#pragma once
#include "../http.hpp"
#include "frame_parser.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stepstream {

enum class ConnectionState {
    Idle,         // never started
    Connecting,   // first attempt after start()
    Open,         // 2xx received, reading frames
    Reconnecting, // backoff pending or retry attempt in flight
    Closed,       // stopped, or the server ended the stream
    Error         // establishment/read failure
};

const char* connection_state_name(ConnectionState state);

struct ReconnectPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{15000};
    uint32_t max_attempts = 0; // consecutive failed reconnects; 0 = retry forever
};

// min(base * 2^attempt, max)
std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, uint32_t attempt);

struct StreamRequest {
    std::string url;
    std::vector<Header> headers;
};

// Owns the network side of one subscription: a worker thread that connects,
// feeds the body through a FrameParser and reconnects with exponential
// backoff until stopped.
//
// Every start()/stop() bumps a generation counter. A worker only delivers
// frames and state changes while its generation is current, and delivery
// happens under a lock that stop() also takes, so nothing from a superseded
// worker reaches the handlers once stop() has returned.
class ConnectionManager {
public:
    // Called at the start of every attempt so the resumption cursor is fresh.
    using RequestFactory = std::function<StreamRequest()>;
    using FrameHandler = std::function<void(const SSEFrame&)>;
    using StateHandler = std::function<void(ConnectionState state, const std::string& error)>;

    explicit ConnectionManager(HttpClient& http, ReconnectPolicy policy = {},
                               long connect_timeout_seconds = 30);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_state_handler(StateHandler handler);

    // Cancel the current stream (if any) and connect on a new worker.
    void start(RequestFactory request, FrameHandler on_frame);

    // Cancel the stream and any pending backoff. Safe to call from a
    // handler running on the worker thread.
    void stop();

    ConnectionState state() const;
    std::string last_error() const;
    uint32_t attempt() const;
    // True once max_attempts ran out; the state stays Error until the next
    // start() or stop().
    bool exhausted() const;
    const ReconnectPolicy& policy() const { return policy_; }

private:
    void run(uint64_t generation, RequestFactory request, FrameHandler on_frame,
             std::shared_ptr<std::atomic<bool>> cancel);
    bool is_current(uint64_t generation) const;
    void set_state(ConnectionState state, const std::string& error = {});
    bool wait_backoff(uint64_t generation, std::chrono::milliseconds delay);
    void cancel_worker(bool mark_closed);
    void join_worker();

    HttpClient& http_;
    ReconnectPolicy policy_;
    long connect_timeout_;
    StateHandler on_state_;

    mutable std::mutex mutex_; // state_, error_, attempt_, exhausted_, worker_, cancel_
    std::condition_variable wakeup_;
    std::recursive_mutex delivery_mutex_;
    std::atomic<uint64_t> generation_{0};
    ConnectionState state_ = ConnectionState::Idle;
    std::string error_;
    uint32_t attempt_ = 0;
    bool exhausted_ = false;
    std::thread worker_;
    std::shared_ptr<std::atomic<bool>> cancel_;
};

} // namespace stepstream
