#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <unordered_map>
#include <utility>

namespace streetwise {

// Bounded map with insertion-order eviction: when full, the oldest key goes first.
// Re-putting an existing key updates the value but keeps its original position.
// A capacity of 0 disables caching.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class FifoCache {
public:
    explicit FifoCache(std::size_t capacity) : cap(capacity) {}

    const Value* find(const Key& key) const {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }

    bool contains(const Key& key) const { return entries.count(key) != 0; }

    void put(const Key& key, Value value) {
        if (cap == 0) return;

        auto it = entries.find(key);
        if (it != entries.end()) {
            it->second = std::move(value);
            return;
        }

        while (entries.size() >= cap && !order.empty()) {
            entries.erase(order.front());
            order.pop_front();
        }
        entries.emplace(key, std::move(value));
        order.push_back(key);
    }

    void clear() {
        entries.clear();
        order.clear();
    }

    std::size_t size() const { return entries.size(); }
    std::size_t capacity() const { return cap; }

private:
    std::unordered_map<Key, Value, Hash> entries;
    std::deque<Key> order;   // oldest at front
    std::size_t cap;
};

} // namespace streetwise
