#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>

namespace ledgerchat {

// Line-oriented message channel to a tool server.
class McpTransport {
public:
    virtual ~McpTransport() = default;

    // Write one message followed by a newline. Throws TransportError.
    virtual void send(const std::string& message) = 0;

    // Next complete line, or nullopt if none arrived within timeout.
    // Throws TransportError once the peer has gone away.
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

// Runs the tool server as a child process (`sh -c command`) and talks to it
// over its stdin/stdout. The child's stderr is inherited.
class StdioTransport : public McpTransport {
public:
    explicit StdioTransport(const std::string& command);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void send(const std::string& message) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() override;

    pid_t pid() const { return pid_; }

private:
    std::optional<std::string> take_line();

    std::string command_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    bool eof_ = false;
    std::string buffer_;
};

} // namespace ledgerchat
