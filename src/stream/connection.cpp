#include "connection.hpp"

#include <algorithm>
#include <iostream>

namespace stepstream {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:         return "idle";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Open:         return "open";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Closed:       return "closed";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, uint32_t attempt) {
    auto delay = policy.base_delay;
    for (uint32_t i = 0; i < attempt && i < 32 && delay < policy.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.max_delay);
}

ConnectionManager::ConnectionManager(HttpClient& http, ReconnectPolicy policy,
                                     long connect_timeout_seconds)
    : http_(http), policy_(policy), connect_timeout_(connect_timeout_seconds)
{}

ConnectionManager::~ConnectionManager() {
    cancel_worker(false);
    join_worker();
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) worker_.detach();
}

void ConnectionManager::set_state_handler(StateHandler handler) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    on_state_ = std::move(handler);
}

void ConnectionManager::start(RequestFactory request, FrameHandler on_frame) {
    cancel_worker(false);
    join_worker();

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    uint64_t generation = 0;
    {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation = ++generation_;
            attempt_ = 0;
            exhausted_ = false;
            error_.clear();
            cancel_ = cancel;
        }
        set_state(ConnectionState::Connecting);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Only reachable when start() runs on the old worker itself.
    if (worker_.joinable()) worker_.detach();
    worker_ = std::thread(&ConnectionManager::run, this, generation,
                          std::move(request), std::move(on_frame), std::move(cancel));
}

void ConnectionManager::stop() {
    cancel_worker(true);
    join_worker();
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ConnectionManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

uint32_t ConnectionManager::attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

bool ConnectionManager::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exhausted_;
}

bool ConnectionManager::is_current(uint64_t generation) const {
    return generation_.load() == generation;
}

// Caller holds delivery_mutex_.
void ConnectionManager::set_state(ConnectionState state, const std::string& error) {
    std::string current_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        if (state == ConnectionState::Error) error_ = error;
        else if (state == ConnectionState::Open) error_.clear();
        current_error = error_;
    }
    if (on_state_) on_state_(state, current_error);
}

bool ConnectionManager::wait_backoff(uint64_t generation, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    wakeup_.wait_for(lock, delay, [&] { return !is_current(generation); });
    return is_current(generation);
}

void ConnectionManager::cancel_worker(bool mark_closed) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        exhausted_ = false;
        if (cancel_) {
            cancel_->store(true);
            cancel_.reset();
        }
        was_active = state_ != ConnectionState::Idle && state_ != ConnectionState::Closed;
    }
    wakeup_.notify_all();
    if (mark_closed && was_active) set_state(ConnectionState::Closed);
}

void ConnectionManager::join_worker() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) return;
        if (worker_.get_id() == std::this_thread::get_id()) return;
        worker = std::move(worker_);
    }
    worker.join();
}

void ConnectionManager::run(uint64_t generation, RequestFactory request,
                            FrameHandler on_frame,
                            std::shared_ptr<std::atomic<bool>> cancel) {
    while (is_current(generation)) {
        StreamRequest req = request();
        FrameParser parser;
        bool opened = false;

        HttpResponse response = http_.stream_get_raw(
            req.url, req.headers,
            [&](long status) -> bool {
                if (status < 200 || status >= 300) return false;
                std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
                if (!is_current(generation)) return false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    attempt_ = 0;
                }
                opened = true;
                set_state(ConnectionState::Open);
                return true;
            },
            [&](const char* data, size_t len) -> bool {
                for (const auto& frame : parser.feed(data, len)) {
                    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
                    if (!is_current(generation)) return false;
                    on_frame(frame);
                }
                return is_current(generation);
            },
            cancel.get(), connect_timeout_);

        {
            std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
            if (!is_current(generation)) return;

            if (opened && response.transport_error) {
                std::string error = "Planner stream connection failed";
                std::cerr << "[stream] " << error << " mid-stream\n";
                set_state(ConnectionState::Error, error);
            } else if (opened) {
                // Server ended the stream; a final frame may lack its blank line.
                if (auto tail = parser.flush()) {
                    on_frame(*tail);
                    if (!is_current(generation)) return;
                }
                set_state(ConnectionState::Closed);
            } else {
                std::string error = response.status_code == 0
                    ? "Planner stream connection failed"
                    : "Planner stream failed with status " + std::to_string(response.status_code);
                std::cerr << "[stream] " << error << '\n';
                set_state(ConnectionState::Error, error);
            }
        }

        uint32_t attempt = this->attempt();
        if (policy_.max_attempts != 0 && attempt >= policy_.max_attempts) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (is_current(generation)) exhausted_ = true;
            }
            std::cerr << "[stream] Giving up after " << attempt << " reconnect attempts\n";
            return;
        }
        auto delay = backoff_delay(policy_, attempt);
        {
            std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
            if (!is_current(generation)) return;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                attempt_ = attempt + 1;
            }
            set_state(ConnectionState::Reconnecting);
        }
        std::cerr << "[stream] Reconnecting in " << delay.count() << "ms (attempt "
                  << (attempt + 1) << ")\n";
        if (!wait_backoff(generation, delay)) return;
    }
}

} // namespace stepstream
