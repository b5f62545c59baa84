#pragma once

#include <chrono>

namespace nestbar {
namespace terminal {

// Monotonic time source, in seconds since an arbitrary origin.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock();
    double now() const override;

private:
    std::chrono::steady_clock::time_point origin_;
};

}
}
