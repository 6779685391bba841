#pragma once

#include <chrono>

// Source of "now" for TTL arithmetic. Must never go backwards.
class IClockSource {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClockSource() = default;
    virtual TimePoint now() const = 0;
};
