// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace stepstream {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http_socket: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos)
        result.path = "/";
    else if (url[path_start] == '?')
        result.path = "/" + url.substr(path_start);
    else
        result.path = url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("http_socket: missing host: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    bool     read_failed = false;

    Connection() = default;
    explicit Connection(const std::atomic<bool>* cancel_flag) : cancel(cancel_flag) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool cancelled() const {
        if (g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed))
            return true;
        return cancel && cancel->load(std::memory_order_relaxed);
    }

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return false;
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return false;
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) return false;
        }

        // 1-second slices so cancellation is noticed between reads on an
        // otherwise idle event stream.
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or cancel.
    // Errors other than cancellation also set read_failed.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (cancelled()) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // slice expired
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                read_failed = true;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                read_failed = true;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (cancelled()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_get_request(const ParsedUrl& url,
                                      const std::vector<Header>& headers,
                                      bool keep_alive) {
    std::string req;
    req.reserve(512);
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    if (keep_alive) {
        req += "Cache-Control: no-cache\r\n";
        req += "Connection: keep-alive\r\n\r\n";
    } else {
        req += "Connection: close\r\n\r\n";
    }
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Reads a CRLF-terminated line into `line`. Returns false on EOF/error before
// a terminator was seen, so an empty header-terminating line is distinguishable.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    size_t content_length = 0;
    bool has_content_length = false;
};

static ResponseHead parse_response_head(Connection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line;
    if (!read_line(conn, leftover, status_line) || status_line.empty()) return head;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return head;
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 599) return head;

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) {
            head.status = status; // blank line → end of headers
            return head;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            head.is_chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
            head.has_content_length = true;
        }
    }
    return head; // headers never terminated
}

// Deliver the body to `sink`, dechunking if needed. Returns false when the
// sink asked to stop or the connection failed mid-body.
static bool stream_body(Connection& conn, std::string& leftover,
                         const ResponseHead& head,
                         const RawChunkCallback& sink) {
    char buf[4096];
    if (head.is_chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            if (size_line.empty()) continue;
            // Chunk size is hex, may have extensions after ';'
            size_t remaining = std::strtoul(size_line.c_str(), nullptr, 16);
            if (remaining == 0) return true;

            while (remaining > 0) {
                if (!leftover.empty()) {
                    size_t take = std::min(remaining, leftover.size());
                    if (!sink(leftover.data(), take)) return false;
                    leftover.erase(0, take);
                    remaining -= take;
                    continue;
                }
                ssize_t n = conn.read_some(buf, std::min(remaining, sizeof(buf)));
                if (n < 0) return false;
                if (n == 0) return true; // server closed mid-chunk
                if (!sink(buf, static_cast<size_t>(n))) return false;
                remaining -= static_cast<size_t>(n);
            }
        }
        return !conn.cancelled() && !conn.read_failed;
    }

    size_t remaining = head.content_length;
    while (!head.has_content_length || remaining > 0) {
        if (!leftover.empty()) {
            size_t take = head.has_content_length
                ? std::min(remaining, leftover.size())
                : leftover.size();
            if (!sink(leftover.data(), take)) return false;
            leftover.erase(0, take);
            if (head.has_content_length) remaining -= take;
            continue;
        }
        size_t want = head.has_content_length ? std::min(remaining, sizeof(buf)) : sizeof(buf);
        ssize_t n = conn.read_some(buf, want);
        if (n < 0) return false;
        if (n == 0) break;
        if (!sink(buf, static_cast<size_t>(n))) return false;
        if (head.has_content_length) remaining -= static_cast<size_t>(n);
    }
    return true;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url_str,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    ParsedUrl url;
    try { url = parse_url(url_str); } catch (const std::exception&) { return {}; }

    Connection conn;
    if (!conn.connect(url, timeout_seconds)) return {};

    std::string request = build_get_request(url, headers, false);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head = parse_response_head(conn, leftover);
    if (head.status == 0) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    stream_body(conn, leftover, head, [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    });
    return resp;
}

// Default base-class implementation delegates to http_stream_get_raw.
HttpResponse HttpClient::stream_get_raw(const std::string& url,
                                         const std::vector<Header>& headers,
                                         StreamOpenCallback on_open,
                                         RawChunkCallback callback,
                                         const std::atomic<bool>* cancel,
                                         long timeout_seconds) {
    return http_stream_get_raw(url, headers, std::move(on_open), std::move(callback),
                               cancel, timeout_seconds);
}

HttpResponse http_stream_get_raw(const std::string& url_str,
                                  const std::vector<Header>& headers,
                                  StreamOpenCallback on_open,
                                  RawChunkCallback callback,
                                  const std::atomic<bool>* cancel,
                                  long timeout_seconds) {
    ParsedUrl url;
    try { url = parse_url(url_str); } catch (const std::exception&) { return {}; }

    Connection conn(cancel);
    if (!conn.connect(url, timeout_seconds)) return {};

    std::string request = build_get_request(url, headers, true);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head = parse_response_head(conn, leftover);
    if (head.status == 0) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    if (on_open && !on_open(head.status)) {
        // Keep a short error body for diagnostics on non-2xx responses.
        stream_body(conn, leftover, head, [&resp](const char* data, size_t len) {
            resp.body.append(data, len);
            return resp.body.size() < 4096;
        });
        return resp;
    }

    if (!stream_body(conn, leftover, head, callback) && conn.read_failed)
        resp.transport_error = true;
    return resp;
}

} // namespace stepstream

#endif // __linux__
