#pragma once
#include <string>

namespace stepstream {

// ISO 8601 UTC timestamp with millisecond precision
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Percent-encode a URL component (RFC 3986 unreserved characters kept)
std::string url_encode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename, creating parent directories.
// Returns false if the file could not be written.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace stepstream
