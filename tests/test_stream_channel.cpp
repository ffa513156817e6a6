#include <catch2/catch.hpp>
#include "stream_channel.hpp"
#include <atomic>
#include <thread>

using namespace ledgerchat;

// ── Ordering ─────────────────────────────────────────────────────

TEST_CASE("StreamChannel: events arrive in send order", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    for (int i = 0; i < 100; i++) {
        REQUIRE(sender.send(StreamEvent::chunk(std::to_string(i))));
    }
    sender.send(StreamEvent::complete());

    StreamEvent ev;
    for (int i = 0; i < 100; i++) {
        REQUIRE(receiver.try_receive(ev) == PollStatus::Ready);
        REQUIRE(ev.kind == StreamEvent::Kind::Chunk);
        REQUIRE(ev.text == std::to_string(i));
    }
    REQUIRE(receiver.try_receive(ev) == PollStatus::Ready);
    REQUIRE(ev.kind == StreamEvent::Kind::Complete);
}

TEST_CASE("StreamChannel: order survives a concurrent producer", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    std::thread producer([s = std::move(sender)]() mutable {
        for (int i = 0; i < 1000; i++) s.send(StreamEvent::chunk(std::to_string(i)));
        s.send(StreamEvent::complete());
    });

    StreamEvent ev;
    int expected = 0;
    while (receiver.receive(ev)) {
        if (ev.kind == StreamEvent::Kind::Complete) break;
        REQUIRE(ev.text == std::to_string(expected));
        expected++;
    }
    producer.join();
    REQUIRE(expected == 1000);
}

// ── Empty vs. finished ───────────────────────────────────────────

TEST_CASE("StreamChannel: empty queue is not completion", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    StreamEvent ev;
    REQUIRE(receiver.try_receive(ev) == PollStatus::Empty);
    REQUIRE(receiver.receive_for(ev, std::chrono::milliseconds(10)) == PollStatus::Empty);

    sender.send(StreamEvent::chunk("late"));
    REQUIRE(receiver.try_receive(ev) == PollStatus::Ready);
    REQUIRE(ev.text == "late");
}

TEST_CASE("StreamChannel: dropped sender disconnects after the queue drains", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    sender.send(StreamEvent::chunk("a"));
    sender.close();

    StreamEvent ev;
    REQUIRE(receiver.try_receive(ev) == PollStatus::Ready);
    REQUIRE(receiver.try_receive(ev) == PollStatus::Disconnected);
    REQUIRE_FALSE(receiver.receive(ev));
}

TEST_CASE("StreamChannel: receive wakes when the sender goes away", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    std::thread producer([s = std::move(sender)]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        s.close();
    });
    StreamEvent ev;
    REQUIRE_FALSE(receiver.receive(ev));
    producer.join();
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("StreamChannel: send fails once the receiver is closed", "[channel]") {
    auto [sender, receiver] = make_stream_channel();
    REQUIRE(sender.receiver_alive());
    receiver.close();
    REQUIRE_FALSE(sender.receiver_alive());
    REQUIRE_FALSE(sender.send(StreamEvent::chunk("x")));
}

TEST_CASE("StreamChannel: send fails once the receiver is destroyed", "[channel]") {
    StreamSender sender;
    {
        auto channel = make_stream_channel();
        sender = std::move(channel.first);
    }
    REQUIRE_FALSE(sender.send(StreamEvent::chunk("x")));
}

TEST_CASE("StreamChannel: receiver joins its attached producer", "[channel]") {
    std::atomic<bool> finished{false};
    {
        auto [sender, receiver] = make_stream_channel();
        receiver.attach_producer(std::thread([s = std::move(sender), &finished]() mutable {
            while (s.send(StreamEvent::chunk("tick"))) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finished = true;
        }));
        StreamEvent ev;
        REQUIRE(receiver.receive(ev));
    }
    REQUIRE(finished);
}
