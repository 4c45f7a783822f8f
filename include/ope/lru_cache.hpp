#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace ope {

// ---------------------------------------------------------------------------
// LruCache<Key, Value> — fixed-capacity map with least-recently-used eviction
// ---------------------------------------------------------------------------
//
// Not synchronised; PatternCache wraps it with a mutex. The owner guarantees
// capacity > 0.

template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {}

    size_t size() const { return index_.size(); }
    size_t capacity() const { return capacity_; }

    bool contains(const Key& key) const { return index_.count(key) != 0; }

    // Lookup and mark as most recently used. Returns nullptr on miss.
    Value* get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        entries_.splice(entries_.begin(), entries_, it->second);
        return &it->second->second;
    }

    // Insert or overwrite `key`, making it most recently used.
    // Returns true if another entry was evicted to make room.
    bool put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return false;
        }

        bool evicted = false;
        if (index_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
            evicted = true;
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
        return evicted;
    }

    void clear() {
        index_.clear();
        entries_.clear();
    }

    // Least recently used key; cache must not be empty.
    const Key& lru_key() const { return entries_.back().first; }

private:
    using Entry = std::pair<Key, Value>;

    size_t capacity_;
    std::list<Entry> entries_;   // front = most recent
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
};

} // namespace ope
