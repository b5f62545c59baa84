#include "nestbar/terminal/clock.hpp"

namespace nestbar {
namespace terminal {

SteadyClock::SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

double SteadyClock::now() const {
    auto elapsed = std::chrono::steady_clock::now() - origin_;
    return std::chrono::duration<double>(elapsed).count();
}

}
}
