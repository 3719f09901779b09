#include "packet_queue.hpp"
#include <algorithm>

PacketQueue::PacketQueue(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

bool PacketQueue::tryPush(PacketRecord packet)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (items_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        items_.push_back(std::move(packet));
    }
    not_empty_.notify_one();
    return true;
}

std::optional<PacketRecord> PacketQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    PacketRecord packet = std::move(items_.front());
    items_.pop_front();
    return packet;
}

void PacketQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

size_t PacketQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed = items_.size();
    items_.clear();
    return removed;
}

size_t PacketQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool PacketQueue::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
