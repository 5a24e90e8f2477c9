#pragma once

#include "display.hpp"
#include "progress_handle.hpp"
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace multibar {
namespace core {

// Iterates an underlying range and advances a bar by one for every element
// consumed. The bar closes when the end is reached; leaving the loop early
// closes it when the Tracked object goes away.
//
//   std::vector<Job> jobs = ...;
//   for (auto& job : core::track(jobs, display)) {
//       job.run();
//   }
//
// A Tracked range must stay where it is once begin() has been called.
template<typename Iterator>
class Tracked {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename std::iterator_traits<Iterator>::value_type;
        using difference_type = typename std::iterator_traits<Iterator>::difference_type;
        using pointer = typename std::iterator_traits<Iterator>::pointer;
        using reference = typename std::iterator_traits<Iterator>::reference;

        iterator(Iterator current, Iterator end, ProgressHandle* handle)
            : current_(std::move(current)), end_(std::move(end)), handle_(handle) {}

        reference operator*() const { return *current_; }

        iterator& operator++() {
            ++current_;
            if (handle_) {
                handle_->advance(1);
                if (current_ == end_) {
                    handle_->close();
                }
            }
            return *this;
        }

        bool operator==(const iterator& other) const { return current_ == other.current_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        Iterator current_;
        Iterator end_;
        ProgressHandle* handle_;
    };

    Tracked(Iterator first, Iterator last, ProgressHandle handle)
        : first_(std::move(first)), last_(std::move(last)), handle_(std::move(handle)) {}

    Tracked(Tracked&&) = default;
    Tracked& operator=(Tracked&&) = default;

    iterator begin() {
        if (first_ == last_) {
            handle_.close();
        }
        return iterator(first_, last_, &handle_);
    }

    iterator end() { return iterator(last_, last_, nullptr); }

    ProgressHandle& handle() { return handle_; }

private:
    Iterator first_;
    Iterator last_;
    ProgressHandle handle_;
};

// Bar total is the range length when it can be counted without consuming
// the range, otherwise the bar is unbounded.
template<typename Iterator>
Tracked<Iterator> track(Iterator first, Iterator last, const std::shared_ptr<Display>& display) {
    using Category = typename std::iterator_traits<Iterator>::iterator_category;

    std::optional<uint64_t> total;
    if constexpr (std::is_base_of_v<std::forward_iterator_tag, Category>) {
        total = static_cast<uint64_t>(std::distance(first, last));
    }
    return Tracked<Iterator>(std::move(first), std::move(last), display->create(total));
}

// Lvalue ranges only: the wrapper holds iterators into the range.
template<typename Range>
auto track(Range& range, const std::shared_ptr<Display>& display)
    -> Tracked<decltype(std::begin(range))> {
    return track(std::begin(range), std::end(range), display);
}

template<typename Range>
void track(Range&& range, const std::shared_ptr<Display>& display,
           std::enable_if_t<!std::is_lvalue_reference_v<Range>>* = nullptr) = delete;

}}
