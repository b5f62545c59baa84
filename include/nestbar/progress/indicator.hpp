#pragma once

#include "nestbar/common/types.hpp"
#include "nestbar/progress/indicator_stack.hpp"
#include "nestbar/progress/line_composer.hpp"
#include "nestbar/progress/rate_tracker.hpp"
#include "nestbar/style/styling.hpp"
#include <exception>
#include <optional>
#include <string>
#include <cstddef>

namespace nestbar {
namespace progress {

// One progress row. CREATED -> ACTIVE -> FINISHED or ABORTED; never reused.
class Indicator {
public:
    // Validates the options and throws common::InvalidConfig before any stack
    // interaction.
    Indicator(std::optional<size_t> total, const common::Options& options,
              IndicatorStack& stack = IndicatorStack::instance());
    ~Indicator();

    Indicator(const Indicator&) = delete;
    Indicator& operator=(const Indicator&) = delete;

    // Pushes the row and draws the initial state.
    void activate();

    // Renders when the update interval has elapsed since the last render, or
    // when the count reaches the known total.
    void advance(size_t n = 1);

    // Forced final render, then the row is committed or removed.
    void finish();

    // Removes the row without a final render. Never throws.
    void abort() noexcept;
    void close() noexcept { abort(); }

    common::IndicatorState state() const { return state_; }
    bool isActive() const { return state_ == common::IndicatorState::ACTIVE; }
    size_t count() const { return tracker_.count(); }
    std::optional<size_t> total() const { return total_; }
    std::optional<size_t> depth() const;

    // Lines handed to the stack, including ones it found unchanged.
    size_t renderCount() const { return render_count_; }
    // True once a write failure turned rendering off.
    bool renderingDisabled() const { return rendering_disabled_; }

private:
    IndicatorStack& stack_;
    common::Options options_;
    style::Style style_;
    std::optional<size_t> total_;

    common::IndicatorState state_ = common::IndicatorState::CREATED;
    std::optional<SlotId> slot_;
    RateTracker tracker_;
    std::optional<double> last_render_time_;
    size_t phase_ = 0;
    size_t render_count_ = 0;
    bool rendering_disabled_ = false;

    void render(double now);
    ComposedLine composeLine(double now);
    size_t lineWidth() const;
    void disableRendering(const std::exception& error);
    void release(bool keep_line);
    void requireState(common::IndicatorState expected, const char* operation) const;
};

}
}
