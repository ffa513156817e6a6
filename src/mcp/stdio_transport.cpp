#include "stdio_transport.hpp"
#include "../errors.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ledgerchat {

StdioTransport::StdioTransport(const std::string& command)
    : command_(command)
{
    // A server that exits mid-write must not kill us
    std::signal(SIGPIPE, SIG_IGN);

    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe(stdin_pipe) != 0) {
        throw TransportError("Failed to create pipes for tool server");
    }
    if (pipe(stdout_pipe) != 0) {
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        throw TransportError("Failed to create pipes for tool server");
    }

    pid_t pid = fork();
    if (pid < 0) {
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        throw TransportError("Failed to fork tool server process");
    }

    if (pid == 0) {
        setsid();
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdin_pipe[0]);
        ::close(stdout_pipe[1]);
        execl("/bin/sh", "sh", "-c", command_.c_str(), nullptr);
        _exit(127);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    std::cerr << "[mcp] started '" << command_ << "' (pid " << pid_ << ")\n";
}

StdioTransport::~StdioTransport() {
    close();
}

void StdioTransport::send(const std::string& message) {
    if (stdin_fd_ < 0) {
        throw TransportError("Tool server connection is closed");
    }
    std::string data = message + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw TransportError(std::string("Failed to write to tool server: ") +
                                 std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

std::optional<std::string> StdioTransport::take_line() {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) return std::nullopt;
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<std::string> StdioTransport::receive(std::chrono::milliseconds timeout) {
    if (auto line = take_line()) return line;
    if (eof_ || stdout_fd_ < 0) {
        throw TransportError("Tool server closed the connection");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> chunk;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return std::nullopt;

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll on tool server failed: ") +
                                 std::strerror(errno));
        }
        if (ret == 0) return std::nullopt;

        ssize_t n = read(stdout_fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Failed to read from tool server: ") +
                                 std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            if (auto line = take_line()) return line;
            throw TransportError("Tool server closed the connection");
        }
        buffer_.append(chunk.data(), static_cast<size_t>(n));
        if (auto line = take_line()) return line;
    }
}

void StdioTransport::close() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (pid_ > 0) {
        // Give the server a moment to exit on EOF before terminating it
        int status = 0;
        pid_t reaped = 0;
        for (int i = 0; i < 20 && reaped == 0; i++) {
            reaped = waitpid(pid_, &status, WNOHANG);
            if (reaped == 0) usleep(10000);
        }
        if (reaped == 0) {
            kill(pid_, SIGTERM);
            waitpid(pid_, &status, 0);
        }
        pid_ = -1;
    }
}

} // namespace ledgerchat
