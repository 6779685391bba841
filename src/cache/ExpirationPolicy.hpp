#ifndef EXPIRATIONPOLICY_HPP
#define EXPIRATIONPOLICY_HPP

#include <chrono>
#include <optional>

#include "CacheEntry.hpp"
#include "../interfaces/IClockSource.hpp"

// TTL measured from insertion; reads never extend it.
class ExpirationPolicy {
public:
    template <class Key, class Value>
    bool isValid(const CacheEntry<Key, Value>& entry, IClockSource::TimePoint now) const {
        return !entry.expires_at.has_value() || now < *entry.expires_at;
    }

    static std::optional<IClockSource::TimePoint> expiryFor(
        IClockSource::TimePoint inserted_at,
        const std::optional<std::chrono::milliseconds>& ttl) {
        if (!ttl) {
            return std::nullopt;
        }
        return inserted_at + *ttl;
    }
};

#endif // EXPIRATIONPOLICY_HPP
