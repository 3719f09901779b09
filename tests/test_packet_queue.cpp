#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "packet_queue.hpp"

namespace {

PacketRecord createTestPacket(uint16_t dst_port) {
    PacketRecord packet;
    packet.src_ip = "192.168.1.10";
    packet.dst_ip = "10.0.0.1";
    packet.dst_port = dst_port;
    packet.size = 64;
    return packet;
}

} // namespace

TEST(PacketQueueTest, FullQueueDropsNewestPacket) {
    PacketQueue queue(3);
    for (uint16_t port = 1; port <= 5; ++port) {
        queue.tryPush(createTestPacket(port));
    }
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);

    // The oldest packets survive
    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->dst_port, 1);
}

TEST(PacketQueueTest, CloseDrainsThenEnds) {
    PacketQueue queue(10);
    EXPECT_TRUE(queue.tryPush(createTestPacket(1)));
    EXPECT_TRUE(queue.tryPush(createTestPacket(2)));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.tryPush(createTestPacket(3)));
    EXPECT_TRUE(queue.pop().has_value());
    EXPECT_TRUE(queue.pop().has_value());
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(PacketQueueTest, CloseWakesBlockedConsumer) {
    PacketQueue queue(10);
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        EXPECT_FALSE(queue.pop().has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned.load());
    queue.close();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST(PacketQueueTest, ClearReportsRemovedPackets) {
    PacketQueue queue(10);
    for (uint16_t port = 1; port <= 4; ++port) {
        queue.tryPush(createTestPacket(port));
    }
    EXPECT_EQ(queue.clear(), 4u);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(PacketQueueTest, ProducersAndConsumersAccountForEveryPacket) {
    PacketQueue queue(64);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 2000;
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> consumed{0};

    std::vector<std::thread> consumers;
    for (int i = 0; i < 2; ++i) {
        consumers.emplace_back([&] {
            while (queue.pop()) {
                consumed.fetch_add(1);
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < kPerProducer; ++i) {
                if (queue.tryPush(createTestPacket(static_cast<uint16_t>(i)))) {
                    accepted.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : producers) t.join();
    queue.close();
    for (auto& t : consumers) t.join();

    EXPECT_EQ(consumed.load(), accepted.load());
    EXPECT_EQ(accepted.load() + queue.dropped(), static_cast<uint64_t>(kProducers * kPerProducer));
}
