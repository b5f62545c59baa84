#include "nestbar/progress/indicator.hpp"
#include "nestbar/common/error_codes.hpp"
#include "nestbar/common/logger.hpp"
#include "nestbar/config/validator.hpp"
#include <algorithm>

namespace nestbar {
namespace progress {

Indicator::Indicator(std::optional<size_t> total, const common::Options& options,
                     IndicatorStack& stack)
    : stack_(stack),
      options_(options),
      total_(total) {
    config::OptionsValidator().enforce(options_);
    style_ = style::makeStyle(options_.text_color, options_.bg_color, options_.rainbow);
}

Indicator::~Indicator() {
    abort();
}

void Indicator::activate() {
    requireState(common::IndicatorState::CREATED, "activate");
    state_ = common::IndicatorState::ACTIVE;

    double now = stack_.clock().now();
    tracker_.start(now);

    try {
        slot_ = stack_.push();
    } catch (const common::RenderFailure& e) {
        disableRendering(e);
        return;
    }

    common::Logger::instance().debug("[Indicator] Activated | slot={} | total={}",
                                     *slot_, total_ ? std::to_string(*total_) : "?");
    render(now);
}

void Indicator::advance(size_t n) {
    requireState(common::IndicatorState::ACTIVE, "advance");

    double now = stack_.clock().now();
    tracker_.advance(n, now);

    // Only the advance that first reaches the total forces a render. A length
    // hint shorter than the range falls back to the interval afterwards.
    size_t count = tracker_.count();
    bool reached_total = total_ && count >= *total_ && count - n < *total_;
    bool interval_elapsed = !last_render_time_ ||
                            now - *last_render_time_ >= options_.update_interval;

    if (interval_elapsed || reached_total) {
        render(now);
    }
}

void Indicator::finish() {
    requireState(common::IndicatorState::ACTIVE, "finish");

    render(stack_.clock().now());
    state_ = common::IndicatorState::FINISHED;

    common::Logger::instance().debug("[Indicator] Finished | count={} | renders={}",
                                     tracker_.count(), render_count_);
    release(options_.leave);
}

void Indicator::abort() noexcept {
    if (state_ == common::IndicatorState::CREATED) {
        state_ = common::IndicatorState::ABORTED;
        return;
    }
    if (state_ != common::IndicatorState::ACTIVE) {
        return;
    }

    state_ = common::IndicatorState::ABORTED;
    release(false);
}

std::optional<size_t> Indicator::depth() const {
    if (!slot_) {
        return std::nullopt;
    }
    return stack_.depthOf(*slot_);
}

void Indicator::render(double now) {
    if (rendering_disabled_ || !slot_) {
        return;
    }

    auto row = stack_.depthOf(*slot_);
    if (!row) {
        // The stack was reset underneath this indicator.
        common::Logger::instance().debug("[Indicator] Slot gone, detaching | slot={}", *slot_);
        slot_.reset();
        return;
    }

    ComposedLine line = composeLine(now);
    last_render_time_ = now;
    ++render_count_;
    ++phase_;

    try {
        stack_.requestRender(*row, line.styled);
    } catch (const common::RenderFailure& e) {
        disableRendering(e);
    }
}

ComposedLine Indicator::composeLine(double now) {
    ComposeRequest request;
    request.count = tracker_.count();
    request.total = total_;
    request.desc = options_.desc;
    request.style = style_;
    request.fill_char = options_.fill_char;
    request.width = lineWidth();
    request.fields = options_.fields;
    request.snapshot = tracker_.snapshot(now, total_);
    request.phase = phase_;
    return compose(request);
}

size_t Indicator::lineWidth() const {
    int columns = options_.ncols ? *options_.ncols : stack_.terminal().columns();
    return static_cast<size_t>(std::max(columns, 1));
}

void Indicator::disableRendering(const std::exception& error) {
    rendering_disabled_ = true;
    common::Logger::instance().debug("[Indicator] Rendering disabled | desc={} | error={}",
                                     options_.desc, error.what());
}

void Indicator::release(bool keep_line) {
    if (!slot_) {
        return;
    }

    SlotId slot = *slot_;
    slot_.reset();

    try {
        auto row = stack_.depthOf(slot);
        if (!row) {
            common::Logger::instance().debug("[Indicator] Slot already released | slot={}", slot);
            return;
        }

        if (keep_line && !rendering_disabled_) {
            stack_.commit(*row);
        } else {
            stack_.pop(*row);
        }
    } catch (const common::RenderFailure& e) {
        rendering_disabled_ = true;
        common::Logger::instance().debug("[Indicator] Release write failed | slot={} | error={}",
                                         slot, e.what());
    } catch (const std::exception& e) {
        stack_.popAll();
        common::Logger::instance().error("[Indicator] Release failed, stack reset | slot={} | error={}",
                                         slot, e.what());
    }
}

void Indicator::requireState(common::IndicatorState expected, const char* operation) const {
    if (state_ == expected) {
        return;
    }

    common::ErrorContext ctx;
    ctx.component = "Indicator";
    ctx.details["operation"] = operation;
    ctx.details["state"] = common::to_string(state_);
    ctx.details["expected"] = common::to_string(expected);
    throw common::StateError(common::ErrorCode::STATE_INVALID_TRANSITION, "", ctx);
}

}
}
