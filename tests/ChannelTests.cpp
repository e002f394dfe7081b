#include <catch2/catch_test_macros.hpp>

#include <QtConcurrent>

#include "Channel.h"

namespace channel {

TEST_CASE("Values arrive in send order", "[channel]") {
    ChannelEnds<int> channel = makeChannel<int>();

    REQUIRE(channel.sender.send(1));
    REQUIRE(channel.sender.send(2));
    REQUIRE(channel.sender.send(3));

    int value = 0;
    REQUIRE(channel.receiver.tryReceive(value));
    CHECK(value == 1);
    REQUIRE(channel.receiver.tryReceive(value));
    CHECK(value == 2);
    REQUIRE(channel.receiver.tryReceive(value));
    CHECK(value == 3);
    CHECK_FALSE(channel.receiver.tryReceive(value));
}

TEST_CASE("Sending fails once the receiver is gone", "[channel]") {
    ChannelEnds<int> channel = makeChannel<int>();
    CHECK(channel.sender.isConnected());

    channel.receiver.close();

    CHECK_FALSE(channel.sender.isConnected());
    CHECK_FALSE(channel.sender.send(7));
}

TEST_CASE("Blocking receive drains queued values before reporting disconnection", "[channel]") {
    ChannelEnds<int> channel = makeChannel<int>();
    REQUIRE(channel.sender.send(42));
    channel.sender.close();

    int value = 0;
    REQUIRE(channel.receiver.receive(value));
    CHECK(value == 42);
    CHECK(channel.receiver.isDisconnected());
    CHECK_FALSE(channel.receiver.receive(value));
}

TEST_CASE("Copied senders keep the channel open", "[channel]") {
    ChannelEnds<int> channel = makeChannel<int>();
    ChannelSender<int> copy = channel.sender;

    channel.sender.close();
    CHECK_FALSE(channel.receiver.isDisconnected());
    REQUIRE(copy.send(5));

    copy.close();
    int value = 0;
    REQUIRE(channel.receiver.tryReceive(value));
    CHECK(value == 5);
    CHECK(channel.receiver.isDisconnected());
}

TEST_CASE("Receiving across threads", "[channel]") {
    ChannelEnds<int> channel = makeChannel<int>();
    const ChannelSender<int> sender = channel.sender;
    channel.sender.close();

    QFuture<void> producer = QtConcurrent::run([sender]() {
        for (int i = 0; i < 100; ++i) {
            sender.send(i);
        }
    });

    int expected = 0;
    int value = 0;
    while (expected < 100 && channel.receiver.receive(value)) {
        CHECK(value == expected);
        ++expected;
    }
    producer.waitForFinished();
    CHECK(expected == 100);
}

TEST_CASE("Moving a receiver over another closes the old channel", "[channel]") {
    ChannelEnds<int> first = makeChannel<int>();
    ChannelEnds<int> second = makeChannel<int>();

    ChannelReceiver<int> receiver = std::move(first.receiver);
    CHECK_FALSE(first.receiver.isValid());
    receiver = std::move(second.receiver);

    CHECK_FALSE(first.sender.send(1));
    CHECK(second.sender.send(2));
}

} // namespace channel
