// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same public API as http.cpp (libcurl); http_init/cleanup are no-ops.
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
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

namespace ledgerchat {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        out.host = host_port.substr(0, colon);
        out.port = host_port.substr(colon + 1);
    } else {
        out.host = host_port;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
}

// ── RAII connection (TCP + optional TLS) bound to a deadline ──

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;
    std::string error;

    explicit Connection(long timeout_secs)
        : deadline(Clock::now() + std::chrono::seconds(timeout_secs)) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long seconds_left() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(
            deadline - Clock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    bool connect(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0) {
            error = "could not resolve host " + url.host;
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect bounded by the deadline
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
                struct timeval tv{std::max(seconds_left(), 1L), 0};
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
        if (!connected) {
            error = "could not connect to " + url.host + ":" + url.port;
            return false;
        }

        if (url.tls) {
            set_socket_timeout(std::max(seconds_left(), 1L));

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS context creation failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS session creation failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                error = "TLS handshake with " + url.host + " failed";
                return false;
            }
        }

        // 1-second slices so the deadline and abort flag are polled
        set_socket_timeout(1);
        return true;
    }

    // >0 on data, 0 on EOF, -1 on error, abort or deadline expiry.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed)) {
                error = "aborted";
                return -1;
            }
            if (Clock::now() >= deadline) {
                error = "deadline exceeded";
                return -1;
            }

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
                error = "TLS read failed";
                return -1;
            }
            n = ::recv(fd, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            error = std::string("read failed: ") + std::strerror(errno);
            return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (Clock::now() >= deadline) {
                error = "deadline exceeded";
                return false;
            }
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed";
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    error = std::string("write failed: ") + std::strerror(errno);
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

static std::string build_request(const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read one line, using leftover as a look-ahead buffer. Returns false on
// EOF or error before a newline arrived.
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

struct BodyFraming {
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Status line + headers. Returns 0 when no valid status line was read.
static long read_response_head(Connection& conn, std::string& leftover,
                               BodyFraming& framing) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return 0;

    // "HTTP/1.1 200 OK"
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || status_line.size() < sp + 4) return 0;
    char* end = nullptr;
    std::string code = status_line.substr(sp + 1, 3);
    long status = std::strtol(code.c_str(), &end, 10);
    if (end != code.c_str() + 3) return 0;

    std::string line;
    while (read_line(conn, leftover, line) && !line.empty()) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (name == "transfer-encoding") {
            framing.chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            framing.content_length = std::strtoul(value.c_str(), nullptr, 10);
            framing.has_length = true;
        }
    }
    return status;
}

// Deliver the body to sink piece by piece, dechunking when needed. Returns
// false when the sink asked to stop.
template <typename Sink>
static bool pump_body(Connection& conn, std::string& leftover,
                      const BodyFraming& framing, Sink&& sink) {
    char buf[4096];

    auto deliver = [&](size_t limit, bool bounded) -> int {
        // 1 = done, 0 = EOF/error, -1 = sink stopped
        size_t remaining = limit;
        while (!bounded || remaining > 0) {
            if (!leftover.empty()) {
                size_t take = bounded ? std::min(remaining, leftover.size()) : leftover.size();
                if (!sink(leftover.data(), take)) return -1;
                leftover.erase(0, take);
                if (bounded) remaining -= take;
                continue;
            }
            size_t want = bounded ? std::min(remaining, sizeof(buf)) : sizeof(buf);
            ssize_t n = conn.read_some(buf, want);
            if (n <= 0) return 0;
            if (!sink(buf, static_cast<size_t>(n))) return -1;
            if (bounded) remaining -= static_cast<size_t>(n);
        }
        return 1;
    };

    if (framing.chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            if (size_line.empty()) continue;
            // Hex size, optional extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            int rc = deliver(chunk_size, true);
            if (rc < 0) return false;
            if (rc == 0) break; // server closed mid-chunk
        }
        return true;
    }
    if (framing.has_length) {
        return deliver(framing.content_length, true) >= 0;
    }
    return deliver(0, false) >= 0; // read until close
}

// Connect, send, and read the response head. On failure resp.error is set
// and false is returned.
static bool open_exchange(Connection& conn, const std::string& url_str,
                          const std::string& body, const std::vector<Header>& headers,
                          std::string& leftover, BodyFraming& framing,
                          HttpResponse& resp) {
    ParsedUrl url;
    if (!parse_url(url_str, url)) {
        resp.error = "invalid URL: " + url_str;
        return false;
    }
    if (!conn.connect(url)) {
        resp.error = conn.error;
        return false;
    }
    std::string request = build_request(url, body, headers);
    if (!conn.write_all(request.data(), request.size())) {
        resp.error = conn.error;
        return false;
    }
    resp.status_code = read_response_head(conn, leftover, framing);
    if (resp.status_code == 0) {
        resp.error = conn.error.empty() ? "malformed HTTP response" : conn.error;
        return false;
    }
    return true;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    Connection conn(timeout_seconds);
    std::string leftover;
    BodyFraming framing;
    HttpResponse resp;
    if (!open_exchange(conn, url, body, headers, leftover, framing, resp)) return resp;

    pump_body(conn, leftover, framing, [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    });
    if (!conn.error.empty()) {
        // Truncated body: report as a transport failure
        resp.status_code = 0;
        resp.error = conn.error;
    }
    return resp;
}

HttpResponse HttpClient::stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds) {
    return http_stream_post_raw(url, body, headers, std::move(callback), timeout_seconds);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  RawChunkCallback callback,
                                  long timeout_seconds) {
    Connection conn(timeout_seconds);
    std::string leftover;
    BodyFraming framing;
    HttpResponse resp;
    if (!open_exchange(conn, url, body, headers, leftover, framing, resp)) return resp;

    if (resp.status_code < 200 || resp.status_code >= 300) {
        pump_body(conn, leftover, framing, [&resp](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        });
        return resp;
    }

    bool completed = pump_body(conn, leftover, framing, callback);
    if (!completed) {
        resp.error = "aborted by receiver";
    } else if (!conn.error.empty()) {
        resp.status_code = 0;
        resp.error = conn.error;
    }
    return resp;
}

} // namespace ledgerchat

#endif // __linux__
