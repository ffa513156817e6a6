#include "tui.hpp"
#include <ostream>
#include <thread>

namespace ledgerchat {

RenderResult render_stream(StreamReceiver& receiver, std::ostream& out,
                           std::chrono::milliseconds tick,
                           const std::atomic<bool>* interrupt) {
    RenderResult result;
    StreamEvent event;

    while (true) {
        if (interrupt && interrupt->load()) {
            result.interrupted = true;
            out << "\n[interrupted]" << std::flush;
            return result;
        }

        PollStatus status = receiver.try_receive(event);
        if (status == PollStatus::Empty) {
            std::this_thread::sleep_for(tick);
            continue;
        }
        if (status == PollStatus::Disconnected) {
            // Producer went away without a terminal event
            result.error = "stream ended unexpectedly";
            out << "\nError: " << result.error << std::flush;
            return result;
        }

        switch (event.kind) {
        case StreamEvent::Kind::Chunk:
            result.text += event.text;
            out << event.text << std::flush;
            break;
        case StreamEvent::Kind::Error:
            result.error = event.text;
            out << (result.text.empty() ? "" : "\n") << "Error: " << event.text << std::flush;
            return result;
        case StreamEvent::Kind::Complete:
            result.completed = true;
            return result;
        }
    }
}

} // namespace ledgerchat
