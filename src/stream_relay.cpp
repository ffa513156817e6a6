#include "stream_relay.hpp"
#include <iostream>

namespace ledgerchat {

void run_relay(RelayJob& job, StreamSender& sender) {
    size_t chunks = 0;
    try {
        ChatResponse response = job.provider->chat_stream(
            job.messages, job.tools, job.options,
            [&sender, &chunks](const StreamDelta& delta) -> bool {
                if (delta.text && !delta.text->empty()) {
                    chunks++;
                    return sender.send(StreamEvent::chunk(*delta.text));
                }
                return sender.receiver_alive();
            });

        if (!sender.receiver_alive()) {
            std::cerr << "[stream] receiver closed after " << chunks << " chunk(s), stopping\n";
            return;
        }
        if (job.on_complete) job.on_complete(response);
        sender.send(StreamEvent::complete());
    } catch (const std::exception& e) {
        std::cerr << "[stream] " << e.what() << '\n';
        sender.send(StreamEvent::error(e.what()));
    }
}

StreamReceiver start_relay(RelayJob job) {
    auto [sender, receiver] = make_stream_channel();
    std::thread producer(
        [job = std::move(job), sender = std::move(sender)]() mutable {
            run_relay(job, sender);
            sender.close();
        });
    receiver.attach_producer(std::move(producer));
    return std::move(receiver);
}

} // namespace ledgerchat
