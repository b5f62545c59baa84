#pragma once

#include "nestbar/common/config.hpp"
#include "nestbar/common/types.hpp"
#include "nestbar/config/validator.hpp"
#include "nestbar/progress/index_range.hpp"
#include "nestbar/progress/indicator.hpp"
#include "nestbar/progress/indicator_stack.hpp"
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <cstddef>

namespace nestbar {
namespace progress {

namespace detail {

template <typename Range, typename = void>
struct has_size : std::false_type {};

template <typename Range>
struct has_size<Range, std::void_t<decltype(std::size(std::declval<const Range&>()))>>
    : std::true_type {};

template <typename Range>
std::optional<size_t> probeLength(const Range& range, const std::optional<size_t>& fallback) {
    if constexpr (has_size<Range>::value) {
        return static_cast<size_t>(std::size(range));
    } else {
        return fallback;
    }
}

}

// Wraps a range so that iterating it drives an Indicator. Single pass:
// begin() activates the indicator and may be called once; reaching the end
// finishes it; destroying the adapter while the loop is still running
// aborts it.
//
// `Range` is an lvalue reference for ranges passed by lvalue, which are then
// referenced rather than copied.
template <typename Range>
class ProgressRange {
public:
    using range_type = std::remove_reference_t<Range>;
    using base_iterator = decltype(std::begin(std::declval<range_type&>()));
    using base_sentinel = decltype(std::end(std::declval<range_type&>()));

    class Sentinel {};

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using reference = decltype(*std::declval<base_iterator&>());
        using value_type = std::remove_cv_t<std::remove_reference_t<reference>>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;

        Iterator(base_iterator current, base_sentinel last, Indicator* indicator)
            : current_(std::move(current)),
              last_(std::move(last)),
              indicator_(indicator) {}

        reference operator*() const { return *current_; }

        // The previous element's body has completed once the loop asks for
        // the next one.
        Iterator& operator++() {
            if (indicator_ && indicator_->isActive()) {
                indicator_->advance();
            }
            ++current_;
            return *this;
        }

        bool operator!=(const Sentinel&) const {
            if (current_ != last_) {
                return true;
            }
            if (indicator_ && indicator_->isActive()) {
                indicator_->finish();
            }
            return false;
        }

        bool operator==(const Sentinel& sentinel) const { return !(*this != sentinel); }

    private:
        base_iterator current_;
        base_sentinel last_;
        Indicator* indicator_;
    };

    ProgressRange(Range&& range, const common::Options& options, IndicatorStack& stack)
        : range_(std::forward<Range>(range)) {
        if (options.disable || !stack.terminal().isInteractive()) {
            config::OptionsValidator().enforce(options);
            return;
        }
        indicator_ = std::make_unique<Indicator>(
            detail::probeLength(range_, options.length), options, stack);
    }

    ProgressRange(ProgressRange&&) = default;
    ProgressRange(const ProgressRange&) = delete;
    ProgressRange& operator=(const ProgressRange&) = delete;

    Iterator begin() {
        if (indicator_) {
            indicator_->activate();
        }
        return Iterator(std::begin(range_), std::end(range_), indicator_.get());
    }

    Sentinel end() { return Sentinel{}; }

    // Aborts the indicator early. Iteration may continue without progress.
    void close() noexcept {
        if (indicator_) {
            indicator_->abort();
        }
    }

    // Null when the range was bypassed.
    Indicator* indicator() { return indicator_.get(); }
    const Indicator* indicator() const { return indicator_.get(); }
    bool bypassed() const { return !indicator_; }

private:
    Range range_;
    std::unique_ptr<Indicator> indicator_;
};

template <typename Range>
ProgressRange<Range> create(Range&& range, const common::Options& options,
                            IndicatorStack& stack = IndicatorStack::instance()) {
    return ProgressRange<Range>(std::forward<Range>(range), options, stack);
}

template <typename Range>
ProgressRange<Range> create(Range&& range) {
    return create(std::forward<Range>(range), common::Config::instance().displayDefaults());
}

inline ProgressRange<IndexRange> nrange(size_t n, const common::Options& options,
                                        IndicatorStack& stack = IndicatorStack::instance()) {
    common::Options sized = options;
    sized.length = n;
    return create(IndexRange(0, n), sized, stack);
}

inline ProgressRange<IndexRange> nrange(size_t n) {
    return nrange(n, common::Config::instance().displayDefaults());
}

inline common::Options defaultOptions() {
    return common::Config::instance().displayDefaults();
}

}
}
