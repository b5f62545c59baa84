#pragma once

#include "nestbar/terminal/terminal.hpp"
#include "nestbar/terminal/clock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace nestbar {
namespace progress {

using SlotId = uint64_t;

// Ordered registry of the rows occupied by active indicators. Depth 0 is the
// outermost indicator and the topmost row; the last pushed slot is the bottom
// row. Between calls the cursor rests at column 0 of the bottom row.
//
// Not thread-safe. Any other output written to the terminal while rows are
// occupied breaks the cursor arithmetic.
class IndicatorStack {
public:
    IndicatorStack(std::shared_ptr<terminal::Terminal> terminal,
                   std::shared_ptr<terminal::Clock> clock);
    ~IndicatorStack();

    IndicatorStack(const IndicatorStack&) = delete;
    IndicatorStack& operator=(const IndicatorStack&) = delete;

    // Process-wide stack drawing on stdout. Its destructor retracts whatever
    // rows are still occupied at process teardown.
    static IndicatorStack& instance();

    // Reserves a new bottom row. Its content appears on the first render.
    SlotId push();

    std::optional<size_t> depthOf(SlotId slot) const;

    // Rewrites the row at `depth` when `text` differs from what it shows.
    // Returns false when the row already showed `text`.
    bool requestRender(size_t depth, const std::string& text);

    // Removes the row at `depth`; rows below move up one line.
    void pop(size_t depth);

    // Leaves the last remaining row on screen and releases it, moving the
    // cursor below it. Falls back to pop() when other rows are active.
    void commit(size_t depth);

    // Retracts every row and invalidates every outstanding slot.
    void popAll() noexcept;

    size_t activeCount() const { return rows_.size(); }
    size_t occupiedLines() const { return occupied_lines_; }
    bool empty() const { return rows_.empty(); }

    terminal::Terminal& terminal() { return *terminal_; }
    const terminal::Terminal& terminal() const { return *terminal_; }
    terminal::Clock& clock() { return *clock_; }

private:
    struct Row {
        SlotId slot;
        std::string shown;
        bool drawn = false;
    };

    std::shared_ptr<terminal::Terminal> terminal_;
    std::shared_ptr<terminal::Clock> clock_;
    std::vector<Row> rows_;
    size_t occupied_lines_ = 0;
    SlotId next_slot_ = 1;
    bool cursor_hidden_ = false;

    void emit(const std::string& sequence);
    size_t bottom() const { return occupied_lines_ - 1; }
    void checkDepth(size_t depth, const char* operation) const;
    void releaseAll();
};

}
}
