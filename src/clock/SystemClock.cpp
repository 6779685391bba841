#include "SystemClock.hpp"

IClockSource::TimePoint SystemClock::now() const {
    return std::chrono::steady_clock::now();
}
