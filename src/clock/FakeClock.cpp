#include "FakeClock.hpp"

#include <stdexcept>
#include <string>

IClockSource::TimePoint FakeClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void FakeClock::advance(std::chrono::milliseconds step) {
    if (step.count() < 0) {
        throw std::invalid_argument("FakeClock cannot move backwards by " + std::to_string(step.count()) + "ms");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += step;
}

void FakeClock::set(std::chrono::milliseconds since_epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint target = TimePoint{} + since_epoch;
    if (target < now_) {
        throw std::invalid_argument("FakeClock cannot be set to " + std::to_string(since_epoch.count()) + "ms, time is monotonic");
    }
    now_ = target;
}
