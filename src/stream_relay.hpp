#pragma once
#include "provider.hpp"
#include "stream_channel.hpp"
#include <functional>
#include <string>
#include <vector>

namespace ledgerchat {

// One streaming backend call, detached from the conversation that built it.
struct RelayJob {
    Provider* provider = nullptr;
    std::vector<ChatMessage> messages;
    std::vector<ToolSpec> tools;
    ChatOptions options;
    // Called with the assembled reply after a natural end, before Complete
    // is sent. Not called for failed or abandoned streams.
    std::function<void(const ChatResponse&)> on_complete;
};

// Producer side of the delivery pipeline: forwards every non-empty text
// fragment as a Chunk, then exactly one Complete or Error. Stops reading
// as soon as a send fails.
void run_relay(RelayJob& job, StreamSender& sender);

// Run the job on a background thread. The thread is owned by the returned
// receiver and joined when it is destroyed.
StreamReceiver start_relay(RelayJob job);

} // namespace ledgerchat
