#pragma once
#include "stream_channel.hpp"
#include <atomic>
#include <chrono>
#include <iosfwd>
#include <string>

namespace ledgerchat {

struct RenderResult {
    std::string text;       // everything rendered for the reply
    bool completed = false; // Complete arrived
    std::string error;      // set when an Error arrived or the stream broke
    bool interrupted = false;
};

// Drain a streamed reply onto `out`, polling the receiver every `tick`.
// Chunks are printed as they arrive; an Error is rendered inline as
// "Error: <message>". Setting `interrupt` abandons the stream; the caller
// then drops the receiver.
RenderResult render_stream(StreamReceiver& receiver, std::ostream& out,
                           std::chrono::milliseconds tick = std::chrono::milliseconds(50),
                           const std::atomic<bool>* interrupt = nullptr);

} // namespace ledgerchat
