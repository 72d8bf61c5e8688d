#include "config.hpp"
#include "http.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "planner_api.hpp"
#include "planner_session.hpp"
#include "util.hpp"
#include "stream/projector.hpp"
#include "stream/replay_client.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>
#include <condition_variable>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: stepstream --session ID --step ID [options]\n"
              << "\n"
              << "Options:\n"
              << "  --session ID         Planner session to attach to\n"
              << "  --step ID            Plan step within the session\n"
              << "  --cursor N           Resume after sequence N\n"
              << "  --no-stop            Keep streaming after the step completes\n"
              << "  --replay             Fetch recorded events, print the projection and exit\n"
              << "  --limit N            Replay page size (default from config)\n"
              << "  --base-url URL       Planner API base URL\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  STEPSTREAM_BASE_URL   Planner API base URL\n"
              << "  STEPSTREAM_TOKEN      Bearer token\n"
              << "  STEPSTREAM_DEVICE_ID  Sent as x-device-id\n"
              << "  STEPSTREAM_TIMEZONE   Sent as x-timezone (falls back to TZ)\n";
}

static bool is_success_status(const std::string& status) {
    std::string lower = stepstream::to_lower(status);
    return lower == "success" || lower == "completed" || lower == "complete";
}

static int exit_code_for(const std::optional<std::string>& status) {
    if (!stepstream::is_terminal_status(status)) return 0;
    return is_success_status(*status) ? 0 : 2;
}

static void print_stages(const std::vector<stepstream::SubagentState>& stages) {
    for (const auto& stage : stages) {
        std::cout << "  " << stage.key << ": " << stage.status;
        if (stage.revision) std::cout << " (rev " << *stage.revision << ")";
        std::cout << '\n';
    }
}

static int run_replay(stepstream::HttpClient& http, const stepstream::Config& config,
                      const std::string& session_id, const std::string& plan_step_id,
                      const std::optional<std::string>& cursor, uint32_t limit) {
    stepstream::ReplayClient client(http, config.base_url,
                                    stepstream::auth_headers(config.auth));
    stepstream::StreamSummary from;
    if (cursor) {
        try {
            from.last_sequence = std::stoll(*cursor);
        } catch (const std::exception&) {
            std::cerr << "Error: --cursor must be a sequence number\n";
            return 1;
        }
    }
    stepstream::StreamSummary summary;
    try {
        summary = client.catch_up(session_id, plan_step_id, from, limit);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    std::cout << stepstream::to_json(summary).dump(2) << '\n';
    return exit_code_for(summary.step_status);
}

static int run_stream(stepstream::HttpClient& http, const stepstream::Config& config,
                      const std::string& session_id, const std::string& plan_step_id,
                      const std::optional<std::string>& cursor) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    stepstream::http_set_abort_flag(&g_shutdown);

    stepstream::EventBus bus;
    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;

    stepstream::subscribe<stepstream::ConnectionStateChangedEvent>(bus,
        [](const stepstream::ConnectionStateChangedEvent& ev) {
            std::cout << "[" << ev.plan_step_id << "] "
                      << stepstream::connection_state_name(ev.state);
            if (!ev.error.empty()) std::cout << ": " << ev.error;
            std::cout << std::endl;
        });

    stepstream::subscribe<stepstream::SummaryUpdatedEvent>(bus,
        [](const stepstream::SummaryUpdatedEvent& ev) {
            std::cout << "[" << ev.plan_step_id << "] " << ev.event_count << " events";
            if (ev.last_sequence) std::cout << ", sequence " << *ev.last_sequence;
            if (ev.step_status) std::cout << ", status " << *ev.step_status;
            std::cout << std::endl;
        });

    auto options = stepstream::PlannerSessionOptions::from_config(config);
    options.bus = &bus;
    options.on_step_completed = [&](const std::string& status,
                                    const std::optional<nlohmann::json>& payload) {
        std::cout << "Step finished: " << status << '\n';
        if (payload) std::cout << payload->dump(2) << '\n';
        std::lock_guard<std::mutex> lock(done_mutex);
        done = true;
        done_cv.notify_all();
    };

    stepstream::PlannerSession session(http, options);
    stepstream::StreamTarget target;
    target.session_id = session_id;
    target.plan_step_id = plan_step_id;
    target.initial_cursor = cursor;
    session.set_target(target);

    std::cerr << "[stepstream] Attached to " << session_id << "/" << plan_step_id << "\n";
    {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (!g_shutdown.load() && !(done && config.stream.stop_on_completion) &&
               !session.retries_exhausted()) {
            done_cv.wait_for(lock, std::chrono::milliseconds(200));
        }
    }
    bool gave_up = session.retries_exhausted();
    session.stop();
    if (gave_up) {
        std::cerr << "[stepstream] Stream unavailable after " << config.stream.max_attempts
                  << " reconnect attempts";
        auto error = session.error();
        if (error) std::cerr << ": " << *error;
        std::cerr << "\n";
    }

    std::cout << "Stages:\n";
    print_stages(session.subagents());
    auto status = session.step_status();
    std::cout << "Status: " << status.value_or("pending") << '\n';
    if (gave_up && !stepstream::is_terminal_status(status)) return 1;
    return exit_code_for(status);
}

int main(int argc, char* argv[]) try {
    std::string session_id;
    std::string plan_step_id;
    std::optional<std::string> cursor;
    std::string base_url;
    std::string limit_arg;
    bool no_stop = false;
    bool replay = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id = argv[++i];
        } else if (std::strcmp(argv[i], "--step") == 0 && i + 1 < argc) {
            plan_step_id = argv[++i];
        } else if (std::strcmp(argv[i], "--cursor") == 0 && i + 1 < argc) {
            cursor = argv[++i];
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--base-url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else if (std::strcmp(argv[i], "--no-stop") == 0) {
            no_stop = true;
        } else if (std::strcmp(argv[i], "--replay") == 0) {
            replay = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (session_id.empty() || plan_step_id.empty()) {
        std::cerr << "Error: --session and --step are required\n";
        print_usage();
        return 1;
    }

    stepstream::http_init();
    auto config = stepstream::Config::load();

    // Override config with CLI args
    if (!base_url.empty()) {
        config.base_url = base_url;
    }
    if (no_stop) {
        config.stream.stop_on_completion = false;
    }
    uint32_t limit = config.replay.page_limit;
    if (!limit_arg.empty()) {
        try {
            limit = static_cast<uint32_t>(std::stoul(limit_arg));
        } catch (const std::exception&) {
            std::cerr << "Error: --limit must be a positive number\n";
            stepstream::http_cleanup();
            return 1;
        }
    }

    stepstream::PlatformHttpClient http_client;
    int rc = replay
        ? run_replay(http_client, config, session_id, plan_step_id, cursor, limit)
        : run_stream(http_client, config, session_id, plan_step_id, cursor);

    stepstream::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
