#include <loom/platform/channel.h>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using loom::platform::Channel;

TEST(ChannelTest, SendThenReceiveKeepsOrder) {
    Channel<int> channel;
    channel.send(1);
    channel.send(2);
    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.try_receive(), 2);
    EXPECT_FALSE(channel.try_receive().has_value());
}

TEST(ChannelTest, MoveOnlyValues) {
    Channel<std::unique_ptr<std::string>> channel;
    channel.send(std::make_unique<std::string>("frame"));
    auto value = channel.receive();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(**value, "frame");
}

TEST(ChannelTest, CloseDrainsThenReturnsNullopt) {
    Channel<int> channel;
    channel.send(7);
    channel.close();
    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.receive(), 7);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(ChannelTest, SendAfterCloseThrows) {
    Channel<int> channel;
    channel.close();
    EXPECT_THROW(channel.send(1), std::runtime_error);
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> channel;
    bool got_value = true;
    std::thread receiver([&]() { got_value = channel.receive().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    receiver.join();
    EXPECT_FALSE(got_value);
}

TEST(ChannelTest, ProducerConsumer) {
    Channel<int> channel;
    constexpr int kCount = 1000;
    std::vector<int> received;

    std::thread consumer([&]() {
        while (auto value = channel.receive()) {
            received.push_back(*value);
        }
    });
    for (int i = 0; i < kCount; ++i) {
        channel.send(i);
    }
    channel.close();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
