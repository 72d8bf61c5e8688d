#pragma once
#include "../http.hpp"
#include "stream_event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stepstream {

struct ReplayPage {
    std::vector<StreamEvent> events; // validated, in server order
    std::optional<std::string> next_cursor;
    bool has_more = false;
};

// Pulls already-recorded planner events from the replay endpoint. Used to
// seed a projection without holding a live stream open.
class ReplayClient {
public:
    ReplayClient(HttpClient& http, std::string base_url, std::vector<Header> context_headers);

    // One page of events after `after`. Throws std::runtime_error on a
    // failed request or an unparseable body.
    ReplayPage fetch_page(const std::string& session_id,
                          const std::string& plan_step_id,
                          const std::optional<std::string>& after,
                          const std::optional<uint32_t>& limit);

    // Fetch pages until the server reports no more and fold them into
    // `from`, resuming after its last sequence.
    StreamSummary catch_up(const std::string& session_id,
                           const std::string& plan_step_id,
                           const StreamSummary& from,
                           uint32_t page_limit);

private:
    HttpClient& http_;
    std::string base_url_;
    std::vector<Header> context_headers_;
};

} // namespace stepstream
