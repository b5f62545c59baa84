#include <gtest/gtest.h>
#include "nestbar/progress/progress_range.hpp"
#include "nestbar/common/error_codes.hpp"
#include "test_support.hpp"
#include <forward_list>
#include <stdexcept>
#include <vector>

using namespace nestbar;
using namespace nestbar::progress;
using nestbar::testing::StackFixture;

namespace {

class ValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

common::Options options() {
    common::Options opts;
    opts.update_interval = 0.0;
    return opts;
}

}

TEST(ProgressRangeTest, ForwardsElementsAndFinishes) {
    StackFixture fx;
    std::vector<int> source = {4, 8, 15, 16, 23, 42};

    auto range = create(source, options(), *fx.stack);
    std::vector<int> seen;
    for (int value : range) {
        EXPECT_EQ(fx.stack->activeCount(), 1u);
        seen.push_back(value);
    }

    EXPECT_EQ(seen, source);
    ASSERT_NE(range.indicator(), nullptr);
    EXPECT_EQ(range.indicator()->state(), common::IndicatorState::FINISHED);
    EXPECT_EQ(range.indicator()->count(), source.size());
    EXPECT_EQ(range.indicator()->total(), source.size());
    EXPECT_TRUE(fx.stack->empty());
    EXPECT_NE(fx.output().find("6/6"), std::string::npos);
}

TEST(ProgressRangeTest, LvalueRangeIsReferenced) {
    StackFixture fx;
    std::vector<int> values = {1, 2, 3};

    for (int& value : create(values, options(), *fx.stack)) {
        value *= 2;
    }

    EXPECT_EQ(values, (std::vector<int>{2, 4, 6}));
}

TEST(ProgressRangeTest, RvalueRangeIsMovedIn) {
    StackFixture fx;
    std::vector<int> seen;

    for (int value : create(std::vector<int>{7, 8}, options(), *fx.stack)) {
        seen.push_back(value);
    }

    EXPECT_EQ(seen, (std::vector<int>{7, 8}));
    EXPECT_TRUE(fx.stack->empty());
}

TEST(ProgressRangeTest, ExceptionAbortsAndPropagatesUnchanged) {
    StackFixture fx;
    std::vector<size_t> seen;

    try {
        for (size_t i : nrange(10, options(), *fx.stack)) {
            if (i == 3) {
                throw ValueError("bad element");
            }
            seen.push_back(i);
        }
        FAIL() << "expected ValueError";
    } catch (const ValueError& e) {
        EXPECT_STREQ(e.what(), "bad element");
    }

    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(fx.stack->activeCount(), 0u);
    EXPECT_EQ(fx.stack->occupiedLines(), 0u);
}

TEST(ProgressRangeTest, NestedLoopsKeepRowAccounting) {
    StackFixture fx;
    std::vector<size_t> during_inner;
    std::vector<size_t> after_inner;

    for (size_t i : nrange(3, options(), *fx.stack)) {
        (void)i;
        for (size_t j : nrange(2, options(), *fx.stack)) {
            (void)j;
            during_inner.push_back(fx.stack->activeCount());
            EXPECT_EQ(fx.stack->occupiedLines(), fx.stack->activeCount());
        }
        after_inner.push_back(fx.stack->activeCount());
        EXPECT_EQ(fx.stack->occupiedLines(), 1u);
    }

    EXPECT_EQ(during_inner, std::vector<size_t>(6, 2));
    EXPECT_EQ(after_inner, std::vector<size_t>(3, 1));
    EXPECT_TRUE(fx.stack->empty());
    EXPECT_EQ(fx.stack->occupiedLines(), 0u);
}

TEST(ProgressRangeTest, BreakLeavesIndicatorUntilRangeDies) {
    StackFixture fx;
    {
        auto range = nrange(10, options(), *fx.stack);
        for (size_t i : range) {
            if (i == 2) break;
        }
        EXPECT_TRUE(range.indicator()->isActive());
        EXPECT_EQ(fx.stack->activeCount(), 1u);
    }
    EXPECT_TRUE(fx.stack->empty());

    for (size_t i : nrange(10, options(), *fx.stack)) {
        if (i == 2) break;
    }
    EXPECT_TRUE(fx.stack->empty());
}

TEST(ProgressRangeTest, CloseAbortsEarly) {
    StackFixture fx;
    auto range = nrange(5, options(), *fx.stack);

    size_t visited = 0;
    for (size_t i : range) {
        ++visited;
        if (i == 1) {
            range.close();
            EXPECT_TRUE(fx.stack->empty());
        }
    }

    EXPECT_EQ(visited, 5u);
    EXPECT_EQ(range.indicator()->state(), common::IndicatorState::ABORTED);
    EXPECT_EQ(range.indicator()->count(), 1u);
}

TEST(ProgressRangeTest, SinglePass) {
    StackFixture fx;
    auto range = nrange(2, options(), *fx.stack);
    range.begin();
    EXPECT_THROW(range.begin(), common::StateError);
}

TEST(ProgressRangeTest, DisableBypassesStack) {
    StackFixture fx;
    auto opts = options();
    opts.disable = true;

    std::vector<int> source = {1, 2, 3};
    std::vector<int> seen;
    auto range = create(source, opts, *fx.stack);
    EXPECT_TRUE(range.bypassed());
    EXPECT_EQ(range.indicator(), nullptr);

    for (int value : range) {
        EXPECT_TRUE(fx.stack->empty());
        seen.push_back(value);
    }

    EXPECT_EQ(seen, source);
    EXPECT_TRUE(fx.output().empty());
}

TEST(ProgressRangeTest, DisabledOptionsAreStillValidated) {
    StackFixture fx;
    auto opts = options();
    opts.disable = true;
    opts.text_color = "purple";

    EXPECT_THROW(create(std::vector<int>{1}, opts, *fx.stack), common::InvalidConfig);
}

TEST(ProgressRangeTest, NonInteractiveTerminalBypassesStack) {
    StackFixture fx(80, false);
    std::vector<size_t> seen;

    auto range = nrange(4, options(), *fx.stack);
    EXPECT_TRUE(range.bypassed());
    for (size_t i : range) {
        seen.push_back(i);
    }

    EXPECT_EQ(seen, (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_TRUE(fx.output().empty());
}

TEST(ProgressRangeTest, LengthFallsBackToOptions) {
    StackFixture fx;
    std::forward_list<int> unsized = {1, 2, 3};

    auto unknown = create(unsized, options(), *fx.stack);
    EXPECT_FALSE(unknown.indicator()->total().has_value());

    auto opts = options();
    opts.length = 3;
    auto known = create(unsized, opts, *fx.stack);
    EXPECT_EQ(known.indicator()->total(), 3u);

    // A probed size wins over the hint.
    opts.length = 99;
    auto probed = create(std::vector<int>{1, 2}, opts, *fx.stack);
    EXPECT_EQ(probed.indicator()->total(), 2u);
}

TEST(ProgressRangeTest, RangeLongerThanLengthHintStaysThrottled) {
    StackFixture fx;
    auto opts = options();
    opts.length = 2;
    opts.update_interval = 10.0;

    auto range = create(std::forward_list<int>(100, 1), opts, *fx.stack);
    size_t seen = 0;
    for (int value : range) {
        seen += static_cast<size_t>(value);
    }

    EXPECT_EQ(seen, 100u);
    EXPECT_EQ(range.indicator()->count(), 100u);
    // Activation, crossing the hint, and finish. The clock never moves.
    EXPECT_LE(range.indicator()->renderCount(), 4u);
    EXPECT_EQ(range.indicator()->state(), common::IndicatorState::FINISHED);
}

TEST(ProgressRangeTest, NrangeCoversHalfOpenInterval) {
    StackFixture fx;
    auto range = nrange(4, options(), *fx.stack);
    EXPECT_EQ(range.indicator()->total(), 4u);

    std::vector<size_t> seen;
    for (size_t i : range) {
        seen.push_back(i);
    }
    EXPECT_EQ(seen, (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(range.indicator()->count(), 4u);
}

TEST(ProgressRangeTest, EmptyRangeFinishesImmediately) {
    StackFixture fx;
    auto range = nrange(0, options(), *fx.stack);
    for (size_t i : range) {
        (void)i;
        FAIL() << "empty range yielded an element";
    }
    EXPECT_EQ(range.indicator()->state(), common::IndicatorState::FINISHED);
    EXPECT_TRUE(fx.stack->empty());
}

TEST(ProgressRangeTest, IndexRangeSize) {
    EXPECT_EQ(IndexRange(2, 5).size(), 3u);
    EXPECT_EQ(IndexRange(5, 2).size(), 0u);
}
