#include "nestbar/progress/indicator_stack.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/error_codes.hpp"
#include "nestbar/common/logger.hpp"
#include <algorithm>

namespace nestbar {
namespace progress {

using namespace constants::ansi;

IndicatorStack::IndicatorStack(std::shared_ptr<terminal::Terminal> terminal,
                               std::shared_ptr<terminal::Clock> clock)
    : terminal_(std::move(terminal)),
      clock_(std::move(clock)) {}

IndicatorStack::~IndicatorStack() {
    popAll();
}

IndicatorStack& IndicatorStack::instance() {
    // Constructed first so it is destroyed after the stack.
    common::Logger::instance();

    static IndicatorStack instance(
        std::make_shared<terminal::FdTerminal>(STDOUT_FILENO),
        std::make_shared<terminal::SteadyClock>());
    return instance;
}

SlotId IndicatorStack::push() {
    std::string sequence;
    bool hides_cursor = !cursor_hidden_;
    if (hides_cursor) {
        sequence += HIDE_CURSOR;
    }
    sequence += occupied_lines_ > 0 ? "\n" : CARRIAGE_RETURN;

    SlotId slot = next_slot_++;
    rows_.push_back(Row{slot, "", false});
    ++occupied_lines_;
    cursor_hidden_ = true;

    try {
        emit(sequence);
    } catch (const common::RenderFailure&) {
        rows_.pop_back();
        --occupied_lines_;
        if (hides_cursor) {
            cursor_hidden_ = false;
        }
        throw;
    }
    if (hides_cursor) {
        terminal_->setCursorHidden(true);
    }

    common::Logger::instance().debug("[Stack] Push | slot={} | depth={} | occupied={}",
                                     slot, rows_.size() - 1, occupied_lines_);
    return slot;
}

std::optional<size_t> IndicatorStack::depthOf(SlotId slot) const {
    auto it = std::find_if(rows_.begin(), rows_.end(),
        [slot](const Row& row) { return row.slot == slot; });
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - rows_.begin());
}

bool IndicatorStack::requestRender(size_t depth, const std::string& text) {
    checkDepth(depth, "render");

    Row& row = rows_[depth];
    if (row.drawn && row.shown == text) {
        return false;
    }
    row.shown = text;
    row.drawn = true;

    size_t distance = bottom() - depth;

    std::string sequence;
    sequence += cursorUp(distance);
    sequence += CARRIAGE_RETURN;
    sequence += ERASE_LINE;
    sequence += text;
    sequence += cursorDown(distance);
    sequence += CARRIAGE_RETURN;

    emit(sequence);
    return true;
}

void IndicatorStack::pop(size_t depth) {
    checkDepth(depth, "pop");

    size_t old_bottom = bottom();
    SlotId slot = rows_[depth].slot;

    std::string sequence = cursorUp(old_bottom - depth);
    for (size_t i = depth; i < old_bottom; ++i) {
        sequence += CARRIAGE_RETURN;
        sequence += ERASE_LINE;
        sequence += rows_[i + 1].shown;
        sequence += cursorDown(1);
    }
    sequence += CARRIAGE_RETURN;
    sequence += ERASE_LINE;

    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(depth));
    --occupied_lines_;

    if (occupied_lines_ > 0) {
        sequence += cursorUp(1);
    }
    sequence += CARRIAGE_RETURN;

    if (rows_.empty() && cursor_hidden_) {
        sequence += SHOW_CURSOR;
        cursor_hidden_ = false;
        terminal_->setCursorHidden(false);
    }

    common::Logger::instance().debug("[Stack] Pop | slot={} | depth={} | occupied={}",
                                     slot, depth, occupied_lines_);
    emit(sequence);
}

void IndicatorStack::commit(size_t depth) {
    checkDepth(depth, "commit");

    if (rows_.size() != 1 || !rows_[depth].drawn) {
        pop(depth);
        return;
    }

    SlotId slot = rows_[depth].slot;
    std::string sequence = "\n";
    if (cursor_hidden_) {
        sequence += SHOW_CURSOR;
    }
    releaseAll();

    common::Logger::instance().debug("[Stack] Commit | slot={} | occupied={}", slot, occupied_lines_);
    emit(sequence);
}

void IndicatorStack::popAll() noexcept {
    if (rows_.empty() && !cursor_hidden_) {
        return;
    }

    size_t retracted = occupied_lines_;

    try {
        std::string sequence;
        if (occupied_lines_ > 0) {
            sequence += cursorUp(bottom());
            for (size_t i = 0; i < occupied_lines_; ++i) {
                sequence += CARRIAGE_RETURN;
                sequence += ERASE_LINE;
                if (i < bottom()) {
                    sequence += cursorDown(1);
                }
            }
            sequence += cursorUp(bottom());
            sequence += CARRIAGE_RETURN;
        }
        if (cursor_hidden_) {
            sequence += SHOW_CURSOR;
        }

        releaseAll();
        emit(sequence);
        common::Logger::instance().debug("[Stack] Reset | retracted={}", retracted);
    } catch (const std::exception& e) {
        releaseAll();
        common::Logger::instance().warn("[Stack] Reset write failed | retracted={} | error={}",
                                        retracted, e.what());
    }
}

void IndicatorStack::emit(const std::string& sequence) {
    terminal_->write(sequence);
    terminal_->flush();
}

void IndicatorStack::checkDepth(size_t depth, const char* operation) const {
    if (depth < rows_.size()) {
        return;
    }

    common::ErrorContext ctx;
    ctx.component = "Stack";
    ctx.details["operation"] = operation;
    ctx.details["depth"] = std::to_string(depth);
    ctx.details["active"] = std::to_string(rows_.size());
    throw common::StateError(common::ErrorCode::STATE_SLOT_NOT_FOUND, "", ctx);
}

void IndicatorStack::releaseAll() {
    rows_.clear();
    occupied_lines_ = 0;
    cursor_hidden_ = false;
    terminal_->setCursorHidden(false);
}

}
}
