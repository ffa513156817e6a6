#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace ledgerchat {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string path;                            // query string stripped
    std::map<std::string, std::string> headers;  // names lowercased
    std::string body;

    // Header value, or "" if absent. name must be lowercase.
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

// Sink for one response. Either send() once, or begin_stream() followed by
// any number of write_chunk() calls and end_stream().
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void send(int status, const std::string& content_type,
                      const std::string& body) = 0;

    virtual void begin_stream(int status, const std::string& content_type) = 0;
    // Returns false once the client has gone away
    virtual bool write_chunk(const std::string& data) = 0;
    virtual void end_stream() = 0;
};

// Minimal TCP HTTP/1.1 server. Connections are handled one at a time on a
// background accept thread; every response closes the connection. Streamed
// responses use chunked transfer encoding.
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8080"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it.
    void stop();

    bool running() const { return running_.load(); }

    // Port actually bound (useful when listening on port 0)
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

const char* http_reason_phrase(int status);

} // namespace ledgerchat
