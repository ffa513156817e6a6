#include "server/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace ledgerchat {

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.count(name) > 0;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    int p = std::stoi(digits);
    if (p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

const char* http_reason_phrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    default:  return "OK";
    }
}

// ── Socket response writer ────────────────────────────────────────────────────

namespace {

constexpr const char* kCorsHeaders =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
    "Access-Control-Allow-Headers: Content-Type, Authorization\r\n";

class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    void send(int status, const std::string& content_type,
              const std::string& body) override {
        if (state_ != State::Idle) return;
        state_ = State::Done;
        std::string resp =
            "HTTP/1.1 " + std::to_string(status) + " " + http_reason_phrase(status) + "\r\n"
            "Content-Type: " + content_type + "\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n" +
            kCorsHeaders +
            "Connection: close\r\n\r\n" + body;
        send_all(resp);
    }

    void begin_stream(int status, const std::string& content_type) override {
        if (state_ != State::Idle) return;
        state_ = State::Streaming;
        std::string head =
            "HTTP/1.1 " + std::to_string(status) + " " + http_reason_phrase(status) + "\r\n"
            "Content-Type: " + content_type + "\r\n"
            "Cache-Control: no-cache\r\n"
            "Transfer-Encoding: chunked\r\n" +
            std::string(kCorsHeaders) +
            "Connection: close\r\n\r\n";
        send_all(head);
    }

    bool write_chunk(const std::string& data) override {
        if (state_ != State::Streaming || broken_) return false;
        if (data.empty()) return true; // an empty chunk would end the body
        char size_line[32];
        std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
        return send_all(std::string(size_line) + data + "\r\n");
    }

    void end_stream() override {
        if (state_ != State::Streaming) return;
        state_ = State::Done;
        send_all("0\r\n\r\n");
    }

    bool responded() const { return state_ != State::Idle; }

private:
    enum class State { Idle, Streaming, Done };

    bool send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size() && !broken_) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                broken_ = true;
                break;
            }
            sent += static_cast<size_t>(n);
        }
        return !broken_;
    }

    int fd_;
    State state_ = State::Idle;
    bool broken_ = false;
};

} // namespace

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    auto fail = [this, &error](const std::string& msg) {
        error = msg;
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 16) != 0) {
        return fail("listen failed");
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    std::cerr << "[server] listening on " << host << ":" << bound_port_ << '\n';
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n; // accept loop also polls running_ once a second
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd >= 0) {
            struct timeval tv{10, 0};  // 10s recv timeout
            ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            handle_connection(cfd);
            ::close(cfd);
        }
    }
}

void HttpServer::handle_connection(int fd) const {
    SocketResponseWriter writer(fd);

    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            writer.send(400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            writer.send(400, "text/plain", "Malformed request line");
            return;
        }
        req.path = pq.substr(0, pq.find('?'));
    }

    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    if (req.method == "POST" || req.method == "PUT") {
        size_t content_len = 0;
        auto it = req.headers.find("content-length");
        if (it != req.headers.end()) {
            try {
                content_len = std::stoul(it->second);
            } catch (const std::exception&) {
                writer.send(400, "text/plain", "Invalid Content-Length");
                return;
            }
        }

        if (content_len > max_body_) {
            writer.send(413, "text/plain", "Payload too large");
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) break;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    std::cerr << "[server] " << req.method << " " << req.path << '\n';
    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] handler failed: " << e.what() << '\n';
        if (!writer.responded()) {
            writer.send(500, "text/plain", "Internal server error");
        } else {
            writer.end_stream();
        }
        return;
    }
    if (!writer.responded()) {
        writer.send(500, "text/plain", "No response");
    }
}

} // namespace ledgerchat
