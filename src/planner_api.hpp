#pragma once
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stepstream {

// GET {base}/api/planner/sessions/{session}/stream?planStepId={step}
std::string build_stream_url(const std::string& base_url,
                             const std::string& session_id,
                             const std::string& plan_step_id);

// GET {base}/api/planner/sessions/{session}/steps/{step}/events?after=&limit=
std::string build_replay_url(const std::string& base_url,
                             const std::string& session_id,
                             const std::string& plan_step_id,
                             const std::optional<std::string>& after,
                             const std::optional<uint32_t>& limit);

// Authorization / x-device-id / x-timezone, each only when configured.
std::vector<Header> auth_headers(const AuthConfig& auth);

// Accept: text/event-stream, the caller's context headers, and
// Last-Event-ID when a cursor is known.
std::vector<Header> stream_headers(const std::vector<Header>& context,
                                   const std::optional<std::string>& cursor);

} // namespace stepstream
