#ifndef EVICTOR_HPP
#define EVICTOR_HPP

#include <cstddef>
#include <vector>

#include "ExpirationPolicy.hpp"
#include "LruCacheStore.hpp"

// Keeps a store within its capacity and drops expired entries when asked.
// The store never calls this on its own.
template <class Key, class Value, class Hash = std::hash<Key>>
class Evictor {
public:
    using Store = LruCacheStore<Key, Value, Hash>;

    // Evicts from the LRU end until size() <= capacity(). Returns the evicted keys, oldest first.
    std::vector<Key> enforceCapacity(Store& store) const {
        std::vector<Key> evicted;
        while (store.size() > store.capacity()) {
            auto victim = store.evictLRU();
            if (!victim) {
                break;
            }
            evicted.push_back(std::move(victim->key));
        }
        return evicted;
    }

    // Removes the entry at key if it has expired. Returns true if it was removed.
    bool reapIfExpired(Store& store, const Key& key, IClockSource::TimePoint now,
                       const ExpirationPolicy& policy) const {
        const auto* entry = store.get(key);
        if (entry == nullptr || policy.isValid(*entry, now)) {
            return false;
        }
        store.remove(key);
        return true;
    }

    std::size_t purgeExpired(Store& store, IClockSource::TimePoint now,
                             const ExpirationPolicy& policy) const {
        return store.removeIf([&policy, now](const typename Store::Entry& entry) {
            return !policy.isValid(entry, now);
        });
    }
};

#endif // EVICTOR_HPP
