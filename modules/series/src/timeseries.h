#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <tChrono/Epoch>

#include "tc_series_global.h"

namespace tc {

enum class Boundary
{
    Exclusive, // Start inclusive, end exclusive
    Inclusive, // Start and end inclusive
};

/// @brief Evenly spaced time points between two boundaries.
///
/// Produces start, start + step, start + 2 * step, ... lazily, from the front
/// with next() or from the back with nextBack(). Elements are computed from
/// their index, never accumulated. Both ends draw from the same remaining
/// elements, interleaved calls meet in the middle and never repeat one.
///
/// The step must be nonzero and point from start toward end, otherwise the
/// constructor throws std::invalid_argument. A descending series (end before
/// start with a negative step) is valid. Ordering is relative to the step
/// direction: no element lies before start or beyond end along the step, so
/// a descending series only yields elements at or below start.
///
/// Counts beyond max size_t saturate. A saturated inclusive series, which
/// needs a full int64 tick range, is one element short at the back: its last
/// element from nextBack() is end - step instead of end.
///
/// @tparam TimePoint_t A std::chrono::time_point with signed ticks. Integral
/// ticks give an exact element count by integer division; floating-point
/// ticks estimate it from the ratio of seconds and correct it at the end
/// boundary.
template <typename TimePoint_t>
class TimeSeries_
{
public:
    using time_point = TimePoint_t;
    using duration = typename TimePoint_t::duration;
    using rep = typename duration::rep;

    static_assert(std::is_signed_v<rep>,
                  "Time ticks are required to be signed");

    class Iterator;

    /// @throw std::invalid_argument on a zero, non-finite or wrongly signed
    /// step, or non-finite boundaries.
    TimeSeries_(const TimePoint_t& start, const TimePoint_t& end,
                const duration& step, Boundary boundary);

    static TimeSeries_ exclusive(const TimePoint_t& start,
                                 const TimePoint_t& end, const duration& step);
    static TimeSeries_ inclusive(const TimePoint_t& start,
                                 const TimePoint_t& end, const duration& step);

    /// Next element from the front, std::nullopt once exhausted.
    std::optional<TimePoint_t> next();

    /// Next element from the back, never one before start along the step.
    std::optional<TimePoint_t> nextBack();

    /// Number of elements not produced yet.
    std::size_t size() const;
    bool empty() const;

    /// Number of elements of the whole series, saturated at max size_t.
    std::size_t total() const;

    /// <size(), size() + 1>, the upper bound is std::nullopt if it overflows.
    std::pair<std::size_t, std::optional<std::size_t>> sizeHint() const;

    /// Drain the remaining elements from the front.
    std::vector<TimePoint_t> collect();

    // Range-based for support, iterating consumes the series.
    Iterator begin();
    std::default_sentinel_t end() const;

    const TimePoint_t& startTime() const;
    const TimePoint_t& endTime() const;
    const duration& step() const;
    Boundary boundary() const;
    bool isInclusive() const;

private:
    std::size_t countElements() const;
    TimePoint_t at(std::size_t index) const;
    bool withinBound(const TimePoint_t& time) const;

private:
    TimePoint_t m_start;
    TimePoint_t m_end;
    duration m_step;
    Boundary m_boundary;
    std::size_t m_total{0};
    // Index of the next element from the front
    std::size_t m_head{0};
    // One past the index of the next element from the back
    std::size_t m_tail{0};
};

template <typename TimePoint_t>
class TimeSeries_<TimePoint_t>::Iterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TimePoint_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const TimePoint_t*;
    using reference = const TimePoint_t&;

    Iterator() = default;
    explicit Iterator(TimeSeries_* series)
        : m_series(series), m_value(series->next())
    {
    }

    reference operator*() const { return *m_value; }
    pointer operator->() const { return &*m_value; }

    Iterator& operator++()
    {
        m_value = m_series->next();
        return *this;
    }
    void operator++(int) { ++*this; }

    friend bool operator==(const Iterator& it, std::default_sentinel_t)
    {
        return !it.m_value.has_value();
    }

private:
    TimeSeries_* m_series{nullptr};
    std::optional<TimePoint_t> m_value;
};

using TimeSeries = TimeSeries_<Epoch>;

TC_SERIES_API std::ostream& operator<<(std::ostream& os, Boundary boundary);

TC_SERIES_API std::ostream& operator<<(std::ostream& os,
                                       const TimeSeries& series);

} // namespace tc

#include "timeseries.impl.hpp"
