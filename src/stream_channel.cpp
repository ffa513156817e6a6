#include "stream_channel.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace ledgerchat {

namespace detail {

struct ChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<StreamEvent> queue;
    bool sender_open = true;
    bool receiver_open = true;
};

} // namespace detail

std::pair<StreamSender, StreamReceiver> make_stream_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {StreamSender(state), StreamReceiver(state)};
}

// ── StreamSender ─────────────────────────────────────────────────

StreamSender::StreamSender(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state)) {}

StreamSender::~StreamSender() {
    close();
}

StreamSender& StreamSender::operator=(StreamSender&& other) noexcept {
    if (this != &other) {
        close();
        state_ = std::move(other.state_);
    }
    return *this;
}

bool StreamSender::send(StreamEvent event) {
    if (!state_) return false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_open) return false;
        state_->queue.push_back(std::move(event));
    }
    state_->cv.notify_one();
    return true;
}

bool StreamSender::receiver_alive() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_open;
}

void StreamSender::close() {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->sender_open = false;
    }
    state_->cv.notify_all();
    state_.reset();
}

// ── StreamReceiver ───────────────────────────────────────────────

StreamReceiver::StreamReceiver(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state)) {}

StreamReceiver::~StreamReceiver() {
    release();
}

StreamReceiver& StreamReceiver::operator=(StreamReceiver&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        producer_ = std::move(other.producer_);
    }
    return *this;
}

void StreamReceiver::release() {
    close();
    if (producer_.joinable()) producer_.join();
    state_.reset();
}

PollStatus StreamReceiver::try_receive(StreamEvent& out) {
    if (!state_) return PollStatus::Disconnected;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->queue.empty()) {
        out = std::move(state_->queue.front());
        state_->queue.pop_front();
        return PollStatus::Ready;
    }
    return state_->sender_open ? PollStatus::Empty : PollStatus::Disconnected;
}

bool StreamReceiver::receive(StreamEvent& out) {
    if (!state_) return false;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] {
        return !state_->queue.empty() || !state_->sender_open;
    });
    if (state_->queue.empty()) return false;
    out = std::move(state_->queue.front());
    state_->queue.pop_front();
    return true;
}

PollStatus StreamReceiver::receive_for(StreamEvent& out, std::chrono::milliseconds timeout) {
    if (!state_) return PollStatus::Disconnected;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this] {
        return !state_->queue.empty() || !state_->sender_open;
    });
    if (!state_->queue.empty()) {
        out = std::move(state_->queue.front());
        state_->queue.pop_front();
        return PollStatus::Ready;
    }
    return state_->sender_open ? PollStatus::Empty : PollStatus::Disconnected;
}

void StreamReceiver::close() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiver_open = false;
    state_->queue.clear();
}

void StreamReceiver::attach_producer(std::thread producer) {
    if (producer_.joinable()) producer_.join();
    producer_ = std::move(producer);
}

} // namespace ledgerchat
