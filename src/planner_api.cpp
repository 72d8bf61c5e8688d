#include "planner_api.hpp"
#include "util.hpp"

namespace stepstream {

static std::string trimmed_base(const std::string& base_url) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base;
}

std::string build_stream_url(const std::string& base_url,
                             const std::string& session_id,
                             const std::string& plan_step_id) {
    return trimmed_base(base_url) + "/api/planner/sessions/" + url_encode(session_id) +
           "/stream?planStepId=" + url_encode(plan_step_id);
}

std::string build_replay_url(const std::string& base_url,
                             const std::string& session_id,
                             const std::string& plan_step_id,
                             const std::optional<std::string>& after,
                             const std::optional<uint32_t>& limit) {
    std::string url = trimmed_base(base_url) + "/api/planner/sessions/" +
                      url_encode(session_id) + "/steps/" + url_encode(plan_step_id) +
                      "/events";
    char sep = '?';
    if (after && !after->empty()) {
        url += sep;
        url += "after=" + url_encode(*after);
        sep = '&';
    }
    if (limit) {
        url += sep;
        url += "limit=" + std::to_string(*limit);
    }
    return url;
}

std::vector<Header> auth_headers(const AuthConfig& auth) {
    std::vector<Header> headers;
    if (!auth.token.empty())
        headers.emplace_back("Authorization", "Bearer " + auth.token);
    if (!auth.device_id.empty())
        headers.emplace_back("x-device-id", auth.device_id);
    if (!auth.timezone.empty())
        headers.emplace_back("x-timezone", auth.timezone);
    return headers;
}

std::vector<Header> stream_headers(const std::vector<Header>& context,
                                   const std::optional<std::string>& cursor) {
    std::vector<Header> headers;
    headers.reserve(context.size() + 2);
    headers.emplace_back("Accept", "text/event-stream");
    headers.insert(headers.end(), context.begin(), context.end());
    if (cursor && !cursor->empty())
        headers.emplace_back("Last-Event-ID", *cursor);
    return headers;
}

} // namespace stepstream
