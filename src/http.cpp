// libcurl HTTP client for non-Linux builds (see http_socket.cpp for Linux).
#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace stepstream {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    if (cancel && cancel->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl, const std::atomic<bool>* cancel) {
    if (g_http_abort_flag || cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(cancel));
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct RawStreamContext {
    CURL* curl = nullptr;
    StreamOpenCallback* on_open = nullptr;
    RawChunkCallback* callback = nullptr;
    bool opened = false;
    bool aborted = false;
    std::string error_body;
};

// Reports the status once, before the first body byte is handed over.
static bool notify_open(RawStreamContext& ctx) {
    if (ctx.opened) return !ctx.aborted;
    ctx.opened = true;
    long status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);
    if (*ctx.on_open && !(*ctx.on_open)(status)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (!notify_open(*ctx)) {
        if (ctx->error_body.size() < 4096) {
            ctx->error_body.append(ptr, total);
            return total;
        }
        return 0;
    }

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    setup_request(req, url, headers);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    apply_abort_hook(req.curl, nullptr);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK)
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

HttpResponse HttpClient::stream_get_raw(const std::string& url,
                                         const std::vector<Header>& headers,
                                         StreamOpenCallback on_open,
                                         RawChunkCallback callback,
                                         const std::atomic<bool>* cancel,
                                         long timeout_seconds) {
    return http_stream_get_raw(url, headers, std::move(on_open), std::move(callback),
                               cancel, timeout_seconds);
}

HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 StreamOpenCallback on_open,
                                 RawChunkCallback callback,
                                 const std::atomic<bool>* cancel,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    setup_request(req, url, headers);
    // Event streams stay open indefinitely: only bound the connect phase.
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    apply_abort_hook(req.curl, cancel);

    RawStreamContext ctx;
    ctx.curl = req.curl;
    ctx.on_open = &on_open;
    ctx.callback = &callback;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    HttpResponse response;
    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    // Transport failure before any response byte arrived.
    if (res != CURLE_OK && !ctx.opened && response.status_code == 0) return {};
    if (!ctx.opened && response.status_code != 0) {
        // Empty body: still report the status to the caller.
        notify_open(ctx);
    }
    // A callback abort or cancellation is not a transport failure.
    if (res != CURLE_OK && ctx.opened && !ctx.aborted && res != CURLE_ABORTED_BY_CALLBACK)
        response.transport_error = true;
    response.body = std::move(ctx.error_body);
    return response;
}

} // namespace stepstream
