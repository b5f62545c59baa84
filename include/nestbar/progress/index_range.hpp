#pragma once

#include <cstddef>
#include <iterator>

namespace nestbar {
namespace progress {

// Half-open [first, last) sequence of indices that knows its own size.
class IndexRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = size_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_t*;
        using reference = size_t;

        Iterator() = default;
        explicit Iterator(size_t value) : value_(value) {}

        size_t operator*() const { return value_; }

        Iterator& operator++() {
            ++value_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator copy = *this;
            ++value_;
            return copy;
        }

        bool operator==(const Iterator& other) const { return value_ == other.value_; }
        bool operator!=(const Iterator& other) const { return value_ != other.value_; }

    private:
        size_t value_ = 0;
    };

    IndexRange(size_t first, size_t last)
        : first_(first), last_(last < first ? first : last) {}

    Iterator begin() const { return Iterator(first_); }
    Iterator end() const { return Iterator(last_); }
    size_t size() const { return last_ - first_; }

private:
    size_t first_;
    size_t last_;
};

}
}
