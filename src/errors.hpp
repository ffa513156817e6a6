#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace ledgerchat {

// Connection or HTTP failure talking to the backend or a tool provider.
// status_code is 0 when no HTTP response was received at all.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what, long status_code = 0)
        : std::runtime_error(what), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

// A reply that could not be understood. The offending payload is kept
// verbatim and appended to the message.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const std::string& what, std::string payload)
        : std::runtime_error(what + ". Response was: " + payload),
          payload_(std::move(payload)) {}

    const std::string& payload() const { return payload_; }

private:
    std::string payload_;
};

// Unknown tool, malformed arguments, timeout or a tool-reported failure.
class ToolError : public std::runtime_error {
public:
    ToolError(std::string tool_name, const std::string& what)
        : std::runtime_error(what), tool_name_(std::move(tool_name)) {}

    const std::string& tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

// Missing credential or launch command. Fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ledgerchat
