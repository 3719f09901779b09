#ifndef PACKET_QUEUE_HPP
#define PACKET_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include "packet_record.hpp"

/**
 * @brief Bounded multi-producer/multi-consumer packet queue
 *
 * tryPush never blocks the capture side: when the queue is full the packet
 * being offered is dropped and counted.
 */
class PacketQueue {
public:
    explicit PacketQueue(size_t capacity);

    PacketQueue(const PacketQueue&) = delete;
    PacketQueue& operator=(const PacketQueue&) = delete;

    bool tryPush(PacketRecord packet);

    // Blocks until a packet is available; empty once closed and drained
    std::optional<PacketRecord> pop();

    void close();

    // Discards everything still queued, returns how many packets were removed
    size_t clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool closed() const;
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<PacketRecord> items_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

#endif // PACKET_QUEUE_HPP
