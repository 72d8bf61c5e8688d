#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace stepstream {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    // Streams only: the connection failed after the status line was read.
    bool transport_error = false;
};

// Called once the response status line and headers have been read.
// Return false to abort before the body is streamed.
using StreamOpenCallback = std::function<bool(long status_code)>;

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    // Long-lived GET. `cancel` is polled between reads; setting it ends the
    // transfer at the next read boundary. status_code is 0 when the
    // connection could not be established.
    virtual HttpResponse stream_get_raw(const std::string& url,
                                        const std::vector<Header>& headers,
                                        StreamOpenCallback on_open,
                                        RawChunkCallback callback,
                                        const std::atomic<bool>* cancel = nullptr,
                                        long timeout_seconds = 30);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

// HTTP GET with raw-chunk streaming (no SSE parsing - caller parses)
HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 StreamOpenCallback on_open,
                                 RawChunkCallback callback,
                                 const std::atomic<bool>* cancel = nullptr,
                                 long timeout_seconds = 30);

} // namespace stepstream
