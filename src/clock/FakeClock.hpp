#ifndef FAKECLOCK_HPP
#define FAKECLOCK_HPP

#include <chrono>
#include <mutex>

#include "../interfaces/IClockSource.hpp"

// Manually driven clock for deterministic expiration tests.
// Starts at the steady_clock epoch; time only moves when advance() or set() is called.
class FakeClock : public IClockSource {
public:
    FakeClock() = default;
    ~FakeClock() override = default;

    TimePoint now() const override;

    // Throws std::invalid_argument for a negative step.
    void advance(std::chrono::milliseconds step);

    // Moves to an absolute offset from the epoch. Throws std::invalid_argument if that is in the past.
    void set(std::chrono::milliseconds since_epoch);

private:
    mutable std::mutex mutex_;
    TimePoint now_{};
};

#endif // FAKECLOCK_HPP
