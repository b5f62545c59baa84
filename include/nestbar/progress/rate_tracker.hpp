#pragma once

#include <optional>
#include <cstddef>

namespace nestbar {
namespace progress {

struct RateSnapshot {
    size_t count = 0;
    double elapsed = 0.0;
    // Iterations per second over the window since the previous snapshot.
    std::optional<double> rate_instant;
    // Iterations per second over the whole run.
    std::optional<double> rate_avg;
    // Seconds remaining; empty unless the total is known and a rate exists.
    std::optional<double> eta;
};

class RateTracker {
public:
    RateTracker() = default;

    void start(double now);
    void advance(size_t n, double now);

    // Moves the trailing window forward to `now`.
    RateSnapshot snapshot(double now, std::optional<size_t> total = std::nullopt);

    bool started() const { return started_; }
    size_t count() const { return count_; }
    double startTime() const { return start_time_; }
    double lastAdvanceTime() const { return last_advance_time_; }

private:
    bool started_ = false;
    size_t count_ = 0;
    double start_time_ = 0.0;
    double last_advance_time_ = 0.0;

    size_t window_count_ = 0;
    double window_time_ = 0.0;
    std::optional<double> last_instant_;
};

}
}
