#include "action_channel.h"

#include <gtest/gtest.h>
#include <thread>

using namespace gcm;

TEST(ActionChannelTest, DeliversInSendOrder) {
    ActionChannel channel;
    auto sender = channel.sender();
    EXPECT_TRUE(sender.send(ActionType::Tick));
    EXPECT_TRUE(sender.send(Action(ActionType::ViewProfileDetails, "p1")));
    EXPECT_TRUE(sender.send(ActionType::Render));
    EXPECT_EQ(channel.pending(), 3u);

    EXPECT_EQ(channel.tryRecv()->type, ActionType::Tick);
    auto second = channel.tryRecv();
    EXPECT_EQ(second->type, ActionType::ViewProfileDetails);
    EXPECT_EQ(second->text, "p1");
    EXPECT_EQ(channel.tryRecv()->type, ActionType::Render);
    EXPECT_FALSE(channel.tryRecv());
}

TEST(ActionChannelTest, SendFailsOnlyWhenReceiverIsGone) {
    ActionSender sender;
    EXPECT_FALSE(sender.connected());
    EXPECT_FALSE(sender.send(ActionType::Quit));

    {
        ActionChannel channel;
        sender = channel.sender();
        EXPECT_TRUE(sender.send(ActionType::Quit));
    }
    EXPECT_FALSE(sender.send(ActionType::Quit));
}

TEST(ActionChannelTest, ManyProducers) {
    ActionChannel channel;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([sender = channel.sender()] {
            for (int i = 0; i < 250; ++i) sender.send(ActionType::Tick);
        });
    }
    for (auto& p : producers) p.join();
    EXPECT_EQ(channel.pending(), 1000u);
}
