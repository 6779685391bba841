#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <optional>

#include "../interfaces/IClockSource.hpp"

template <class Key, class Value>
struct CacheEntry {
    Key key;
    Value value;
    IClockSource::TimePoint inserted_at{};
    std::optional<IClockSource::TimePoint> expires_at; // nullopt: never expires
};

#endif // CACHEENTRY_HPP
