#ifndef LRU_CACHE_HPP
#define LRU_CACHE_HPP

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

// Bounded LRU map. All access goes through callbacks that run under the
// cache mutex, so updates to a value are never lost between threads.
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
private:
    size_t capacity_;
    std::list<std::pair<Key, Value>> items_;
    std::unordered_map<Key, typename std::list<std::pair<Key, Value>>::iterator, Hash> index_;
    mutable std::mutex mutex_;

    void evict_overflow() {
        while (index_.size() > capacity_) {
            auto last = std::prev(items_.end());
            index_.erase(last->first);
            items_.pop_back();
        }
    }

public:
    explicit LRUCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Insert with make() when absent, then apply func to the stored value
    template<typename MakeFunc, typename UpdateFunc>
    void upsert(const Key& key, MakeFunc&& make, UpdateFunc&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            items_.emplace_front(key, make());
            index_[key] = items_.begin();
            func(items_.front().second);
            evict_overflow();
            return;
        }
        func(it->second->second);
        items_.splice(items_.begin(), items_, it->second);
    }

    template<typename UpdateFunc>
    bool with_write(const Key& key, UpdateFunc&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        func(it->second->second);
        items_.splice(items_.begin(), items_, it->second);
        return true;
    }

    // Read access that does not refresh recency
    template<typename ReadFunc>
    bool with_read(const Key& key, ReadFunc&& func) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        func(it->second->second);
        return true;
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        items_.erase(it->second);
        index_.erase(it);
        return true;
    }

    template<typename Predicate>
    size_t erase_if(Predicate&& pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = items_.begin(); it != items_.end();) {
            if (pred(it->first, it->second)) {
                index_.erase(it->first);
                it = items_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        items_.clear();
    }

    template<typename Func>
    void for_each(Func&& func) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : items_) {
            func(item.first, item.second);
        }
    }
};

// Lock-striped set of LRU caches. A key always lands in the same shard, so
// workers touching different keys rarely contend on the same mutex.
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class ShardedLRUCache {
public:
    static constexpr size_t DEFAULT_SHARDS = 16;

    explicit ShardedLRUCache(size_t total_capacity, size_t shard_count = DEFAULT_SHARDS) {
        if (shard_count == 0) {
            shard_count = 1;
        }
        size_t per_shard = (total_capacity + shard_count - 1) / shard_count;
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<LRUCache<Key, Value, Hash>>(per_shard));
        }
    }

    template<typename MakeFunc, typename UpdateFunc>
    void upsert(const Key& key, MakeFunc&& make, UpdateFunc&& func) {
        shard(key).upsert(key, std::forward<MakeFunc>(make), std::forward<UpdateFunc>(func));
    }

    template<typename UpdateFunc>
    bool with_write(const Key& key, UpdateFunc&& func) {
        return shard(key).with_write(key, std::forward<UpdateFunc>(func));
    }

    template<typename ReadFunc>
    bool with_read(const Key& key, ReadFunc&& func) const {
        return shard(key).with_read(key, std::forward<ReadFunc>(func));
    }

    bool erase(const Key& key) { return shard(key).erase(key); }

    // Shards are swept one at a time; record() on other shards proceeds
    template<typename Predicate>
    size_t erase_if(Predicate&& pred) {
        size_t removed = 0;
        for (auto& s : shards_) {
            removed += s->erase_if(pred);
        }
        return removed;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& s : shards_) {
            total += s->size();
        }
        return total;
    }

    void clear() {
        for (auto& s : shards_) {
            s->clear();
        }
    }

    template<typename Func>
    void for_each(Func&& func) const {
        for (const auto& s : shards_) {
            s->for_each(func);
        }
    }

private:
    LRUCache<Key, Value, Hash>& shard(const Key& key) {
        return *shards_[Hash{}(key) % shards_.size()];
    }
    const LRUCache<Key, Value, Hash>& shard(const Key& key) const {
        return *shards_[Hash{}(key) % shards_.size()];
    }

    std::vector<std::unique_ptr<LRUCache<Key, Value, Hash>>> shards_;
};

#endif // LRU_CACHE_HPP
