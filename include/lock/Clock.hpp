#pragma once

#include "lock/model/Lock.hpp"

namespace lw::lock {

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual model::Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] model::Timestamp now() const override {
        return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    }
};

}
