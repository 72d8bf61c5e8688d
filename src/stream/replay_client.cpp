#include "replay_client.hpp"
#include "normalizer.hpp"
#include "projector.hpp"
#include "../planner_api.hpp"

#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace stepstream {

using json = nlohmann::json;

ReplayClient::ReplayClient(HttpClient& http, std::string base_url,
                           std::vector<Header> context_headers)
    : http_(http), base_url_(std::move(base_url)),
      context_headers_(std::move(context_headers))
{}

ReplayPage ReplayClient::fetch_page(const std::string& session_id,
                                    const std::string& plan_step_id,
                                    const std::optional<std::string>& after,
                                    const std::optional<uint32_t>& limit) {
    std::vector<Header> headers;
    headers.emplace_back("Accept", "application/json");
    headers.insert(headers.end(), context_headers_.begin(), context_headers_.end());

    auto url = build_replay_url(base_url_, session_id, plan_step_id, after, limit);
    auto response = http_.get(url, headers);
    if (response.status_code == 0) {
        throw std::runtime_error("Planner replay request failed: no response");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error("Planner replay request failed with " +
                                 std::to_string(response.status_code) + ": " + response.body);
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Planner replay returned invalid JSON: ") + e.what());
    }
    if (!body.is_object()) {
        throw std::runtime_error("Planner replay returned a non-object body");
    }

    ReplayPage page;
    auto events = body.find("events");
    if (events != body.end() && events->is_array()) {
        for (const auto& item : *events) {
            if (auto event = normalize_event(item)) page.events.push_back(std::move(*event));
        }
    }
    auto cursor = body.find("next_cursor");
    if (cursor != body.end()) {
        if (cursor->is_string()) page.next_cursor = cursor->get<std::string>();
        else if (cursor->is_number()) page.next_cursor = cursor->dump();
    }
    auto has_more = body.find("has_more");
    page.has_more = has_more != body.end() && has_more->is_boolean() && has_more->get<bool>();
    return page;
}

StreamSummary ReplayClient::catch_up(const std::string& session_id,
                                     const std::string& plan_step_id,
                                     const StreamSummary& from,
                                     uint32_t page_limit) {
    StreamSummary summary = from;
    std::optional<std::string> after;
    if (summary.last_sequence) after = std::to_string(*summary.last_sequence);

    while (true) {
        ReplayPage page = fetch_page(session_id, plan_step_id, after, page_limit);
        summary = apply_events(summary, page.events);
        if (!page.has_more || page.events.empty()) break;

        std::optional<std::string> next = page.next_cursor;
        if (!next && summary.last_sequence) next = std::to_string(*summary.last_sequence);
        if (!next || next == after) {
            std::cerr << "[replay] Cursor did not advance past " << after.value_or("start")
                      << "; stopping\n";
            break;
        }
        after = next;
    }
    return summary;
}

} // namespace stepstream
