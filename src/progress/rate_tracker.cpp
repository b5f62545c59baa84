#include "nestbar/progress/rate_tracker.hpp"
#include <algorithm>
#include <cmath>

namespace nestbar {
namespace progress {

void RateTracker::start(double now) {
    started_ = true;
    count_ = 0;
    start_time_ = now;
    last_advance_time_ = now;
    window_count_ = 0;
    window_time_ = now;
    last_instant_.reset();
}

void RateTracker::advance(size_t n, double now) {
    if (!started_) {
        start(now);
    }
    count_ += n;
    last_advance_time_ = std::max(last_advance_time_, now);
}

RateSnapshot RateTracker::snapshot(double now, std::optional<size_t> total) {
    RateSnapshot snap;
    snap.count = count_;

    if (!started_) {
        return snap;
    }

    snap.elapsed = std::max(0.0, now - start_time_);

    if (count_ > 0 && snap.elapsed > 0.0) {
        snap.rate_avg = static_cast<double>(count_) / snap.elapsed;
    }

    // The window stays open until it has seen both progress and time, so the
    // first advance after a stall reports the rate across the stall.
    size_t window_delta = count_ - window_count_;
    double window_span = now - window_time_;
    if (window_delta > 0 && window_span > 0.0) {
        last_instant_ = static_cast<double>(window_delta) / window_span;
        window_count_ = count_;
        window_time_ = now;
    }
    snap.rate_instant = last_instant_;

    std::optional<double> rate = snap.rate_instant ? snap.rate_instant : snap.rate_avg;
    if (total && rate && *rate > 0.0 && std::isfinite(*rate)) {
        size_t remaining = *total > count_ ? *total - count_ : 0;
        snap.eta = static_cast<double>(remaining) / *rate;
    }

    return snap;
}

}
}
