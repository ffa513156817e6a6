#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace ledgerchat {

struct StreamEvent {
    enum class Kind { Chunk, Error, Complete };

    Kind kind = Kind::Complete;
    std::string text; // chunk text or error message

    static StreamEvent chunk(std::string text) { return {Kind::Chunk, std::move(text)}; }
    static StreamEvent error(std::string message) { return {Kind::Error, std::move(message)}; }
    static StreamEvent complete() { return {Kind::Complete, {}}; }
};

enum class PollStatus {
    Ready,        // an event was taken
    Empty,        // nothing queued yet, producer still running
    Disconnected  // producer gone and queue drained
};

namespace detail {
struct ChannelState;
}

// Producer end of a single-producer single-consumer ordered channel.
// Destroying it marks the channel disconnected for the receiver.
class StreamSender {
public:
    StreamSender() = default;
    explicit StreamSender(std::shared_ptr<detail::ChannelState> state);
    ~StreamSender();

    StreamSender(StreamSender&& other) noexcept = default;
    StreamSender& operator=(StreamSender&& other) noexcept;
    StreamSender(const StreamSender&) = delete;
    StreamSender& operator=(const StreamSender&) = delete;

    // Queue an event. Returns false once the receiver has gone away; that
    // is the producer's signal to stop.
    bool send(StreamEvent event);

    bool receiver_alive() const;

    void close();

private:
    std::shared_ptr<detail::ChannelState> state_;
};

// Consumer end. The queue is unbounded; an empty queue never means the
// stream is over, only PollStatus::Disconnected or a Complete/Error event do.
class StreamReceiver {
public:
    StreamReceiver() = default;
    explicit StreamReceiver(std::shared_ptr<detail::ChannelState> state);
    // Closes the channel and joins an attached producer thread.
    ~StreamReceiver();

    StreamReceiver(StreamReceiver&& other) noexcept = default;
    StreamReceiver& operator=(StreamReceiver&& other) noexcept;
    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    // Non-blocking poll for fixed-cadence consumers.
    PollStatus try_receive(StreamEvent& out);

    // Block until an event arrives. Returns false once the producer is gone
    // and nothing is left.
    bool receive(StreamEvent& out);

    PollStatus receive_for(StreamEvent& out, std::chrono::milliseconds timeout);

    // Stop accepting events and discard queued ones. Later sends fail.
    void close();

    // The thread is joined when this receiver is destroyed or reassigned.
    void attach_producer(std::thread producer);

private:
    void release();

    std::shared_ptr<detail::ChannelState> state_;
    std::thread producer_;
};

std::pair<StreamSender, StreamReceiver> make_stream_channel();

} // namespace ledgerchat
