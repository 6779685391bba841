#ifndef LRUCACHESTORE_HPP
#define LRUCACHESTORE_HPP

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

#include "CacheEntry.hpp"
#include "../errors/CacheErrors.hpp"

// Key -> entry mapping with recency order (front = most recent, back = least recent).
// Not thread safe and unaware of time: locking belongs to the owner, expiration to
// ExpirationPolicy, and the capacity bound to Evictor.
template <class Key, class Value, class Hash = std::hash<Key>>
class LruCacheStore {
public:
    using Entry = CacheEntry<Key, Value>;

    explicit LruCacheStore(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw ConfigError("Cache capacity must be greater than zero");
        }
    }

    LruCacheStore(const LruCacheStore&) = delete;
    LruCacheStore& operator=(const LruCacheStore&) = delete;

    // Returns the entry without changing its recency, or nullptr.
    // The pointer is invalidated by any mutating call.
    const Entry* get(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        return &*it->second;
    }

    // Inserts, or replaces value and expiry of an existing key. Either way the key becomes MRU.
    void put(Entry entry) {
        auto it = index_.find(entry.key);
        if (it != index_.end()) {
            *it->second = std::move(entry);
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
            return;
        }
        lru_list_.push_front(std::move(entry));
        index_.emplace(lru_list_.front().key, lru_list_.begin());
    }

    // Moves an existing key to the MRU position. Returns false if the key is absent.
    bool touch(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return true;
    }

    std::optional<Entry> evictLRU() {
        if (lru_list_.empty()) {
            return std::nullopt;
        }
        Entry victim = std::move(lru_list_.back());
        index_.erase(victim.key);
        lru_list_.pop_back();
        return victim;
    }

    std::optional<Entry> remove(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        Entry removed = std::move(*it->second);
        lru_list_.erase(it->second);
        index_.erase(it);
        return removed;
    }

    // Removes every entry matching pred, walking from LRU to MRU. Returns the number removed.
    template <class Predicate>
    std::size_t removeIf(Predicate pred) {
        std::size_t removed = 0;
        for (auto it = lru_list_.rbegin(); it != lru_list_.rend(); ) {
            if (pred(*it)) {
                index_.erase(it->key);
                // erase takes the base iterator, which points one past the reverse position
                it = std::make_reverse_iterator(lru_list_.erase(std::next(it).base()));
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        index_.clear();
        lru_list_.clear();
    }

    std::size_t size() const { return index_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return index_.empty(); }

    // Least recently used key, if any. Used by diagnostics and tests.
    std::optional<Key> lruKey() const {
        if (lru_list_.empty()) {
            return std::nullopt;
        }
        return lru_list_.back().key;
    }

    // Most recently used key, if any.
    std::optional<Key> mruKey() const {
        if (lru_list_.empty()) {
            return std::nullopt;
        }
        return lru_list_.front().key;
    }

private:
    using List = std::list<Entry>;

    const std::size_t capacity_;
    List lru_list_;
    std::unordered_map<Key, typename List::iterator, Hash> index_;
};

#endif // LRUCACHESTORE_HPP
