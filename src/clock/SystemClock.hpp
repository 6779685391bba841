#pragma once

#include "../interfaces/IClockSource.hpp"

class SystemClock : public IClockSource {
public:
    ~SystemClock() override = default;
    TimePoint now() const override;
};
