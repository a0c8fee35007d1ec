#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>

#include <glog/logging.h>
#include <magic_enum/magic_enum.hpp>

#include <tChrono/TimeUtils>

#include "timeseries.h"

namespace tc {

namespace internal {

inline constexpr auto kMaxElementCount{
    std::numeric_limits<std::size_t>::max()};

// |a - b| without signed overflow
template <typename Rep>
constexpr std::make_unsigned_t<Rep> absDiff(Rep a, Rep b)
{
    using URep = std::make_unsigned_t<Rep>;
    return a >= b ? static_cast<URep>(a) - static_cast<URep>(b)
                  : static_cast<URep>(b) - static_cast<URep>(a);
}

template <typename Rep>
constexpr std::make_unsigned_t<Rep> absValue(Rep a)
{
    return absDiff(a, Rep{0});
}

template <typename Rep>
inline bool isFinite(Rep value)
{
    if constexpr (std::is_floating_point_v<Rep>) {
        return std::isfinite(value);
    }
    else {
        return true;
    }
}

} // namespace internal

template <typename TimePoint_t>
TimeSeries_<TimePoint_t>::TimeSeries_(const TimePoint_t& start,
                                      const TimePoint_t& end,
                                      const duration& step, Boundary boundary)
    : m_start(start), m_end(end), m_step(step), m_boundary(boundary)
{
    if (!internal::isFinite(start.time_since_epoch().count()) ||
        !internal::isFinite(end.time_since_epoch().count())) {
        throw std::invalid_argument("Time series boundaries must be finite");
    }
    if (!internal::isFinite(step.count())) {
        throw std::invalid_argument("Time series step must be finite");
    }
    if (step == duration::zero()) {
        throw std::invalid_argument("Time series step must be nonzero");
    }
    if ((start < end && step < duration::zero()) ||
        (end < start && step > duration::zero())) {
        throw std::invalid_argument(
            "Time series step must point from start toward end");
    }

    m_total = countElements();
    m_tail = m_total;

    VLOG(1) << magic_enum::enum_name(m_boundary) << " time series of "
            << m_total << " elements, step " << time::toSeconds(m_step)
            << "s.";
}

template <typename TimePoint_t>
TimeSeries_<TimePoint_t> TimeSeries_<TimePoint_t>::exclusive(
    const TimePoint_t& start, const TimePoint_t& end, const duration& step)
{
    return {start, end, step, Boundary::Exclusive};
}

template <typename TimePoint_t>
TimeSeries_<TimePoint_t> TimeSeries_<TimePoint_t>::inclusive(
    const TimePoint_t& start, const TimePoint_t& end, const duration& step)
{
    return {start, end, step, Boundary::Inclusive};
}

template <typename TimePoint_t>
std::optional<TimePoint_t> TimeSeries_<TimePoint_t>::next()
{
    if (m_head >= m_tail) {
        return {};
    }

    return at(m_head++);
}

template <typename TimePoint_t>
std::optional<TimePoint_t> TimeSeries_<TimePoint_t>::nextBack()
{
    if (m_tail <= m_head) {
        return {};
    }

    return at(--m_tail);
}

template <typename TimePoint_t>
std::size_t TimeSeries_<TimePoint_t>::size() const
{
    DCHECK_LE(m_head, m_tail);
    DCHECK_LE(m_tail, m_total);
    return m_tail - m_head;
}

template <typename TimePoint_t>
bool TimeSeries_<TimePoint_t>::empty() const
{
    return size() == 0;
}

template <typename TimePoint_t>
std::size_t TimeSeries_<TimePoint_t>::total() const
{
    return m_total;
}

template <typename TimePoint_t>
std::pair<std::size_t, std::optional<std::size_t>>
TimeSeries_<TimePoint_t>::sizeHint() const
{
    const auto len = size();
    if (len == internal::kMaxElementCount) {
        return {len, std::nullopt};
    }

    return {len, len + 1};
}

template <typename TimePoint_t>
std::vector<TimePoint_t> TimeSeries_<TimePoint_t>::collect()
{
    std::vector<TimePoint_t> times;
    times.reserve(size());
    while (const auto time = next()) {
        times.push_back(*time);
    }

    return times;
}

template <typename TimePoint_t>
typename TimeSeries_<TimePoint_t>::Iterator TimeSeries_<TimePoint_t>::begin()
{
    return Iterator{this};
}

template <typename TimePoint_t>
std::default_sentinel_t TimeSeries_<TimePoint_t>::end() const
{
    return std::default_sentinel;
}

template <typename TimePoint_t>
const TimePoint_t& TimeSeries_<TimePoint_t>::startTime() const
{
    return m_start;
}

template <typename TimePoint_t>
const TimePoint_t& TimeSeries_<TimePoint_t>::endTime() const
{
    return m_end;
}

template <typename TimePoint_t>
const typename TimeSeries_<TimePoint_t>::duration&
TimeSeries_<TimePoint_t>::step() const
{
    return m_step;
}

template <typename TimePoint_t>
Boundary TimeSeries_<TimePoint_t>::boundary() const
{
    return m_boundary;
}

template <typename TimePoint_t>
bool TimeSeries_<TimePoint_t>::isInclusive() const
{
    return m_boundary == Boundary::Inclusive;
}

template <typename TimePoint_t>
std::size_t TimeSeries_<TimePoint_t>::countElements() const
{
    if constexpr (std::chrono::treat_as_floating_point_v<rep>) {
        const double approx = std::abs(time::toSeconds(m_end - m_start) /
                                       time::toSeconds(m_step));
        const double estimate =
            isInclusive() ? std::floor(approx) + 1. : std::ceil(approx);
        // Also rejects NaN, max size_t itself rounds up to 2^64 as double
        if (!(estimate < static_cast<double>(internal::kMaxElementCount))) {
            LOG(WARNING) << "Time series element count " << estimate
                         << " saturates to " << internal::kMaxElementCount;
            return internal::kMaxElementCount;
        }

        // The ratio of seconds may round across the end boundary, settle the
        // last element against the boundary itself.
        auto count = static_cast<std::size_t>(estimate);
        while (count > 0 && !withinBound(at(count - 1))) {
            --count;
        }
        while (count < internal::kMaxElementCount && withinBound(at(count))) {
            ++count;
        }
        return count;
    }
    else {
        using URep = std::make_unsigned_t<rep>;

        const URep span = internal::absDiff(m_end.time_since_epoch().count(),
                                            m_start.time_since_epoch().count());
        const URep stride = internal::absValue(m_step.count());
        const URep quotient = span / stride;
        const URep remainder = span % stride;

        // Inclusive: k * stride <= span, exclusive: k * stride < span
        const bool saturated =
            isInclusive() && quotient == std::numeric_limits<URep>::max();
        const URep count =
            isInclusive() ? (saturated ? quotient : quotient + 1)
                          : quotient + (remainder == 0 ? 0 : 1);
        if (saturated || count > internal::kMaxElementCount) {
            LOG(WARNING) << "Time series element count saturates to "
                         << internal::kMaxElementCount
                         << (saturated ? ", the end boundary is dropped." : "");
            return internal::kMaxElementCount;
        }

        return static_cast<std::size_t>(count);
    }
}

template <typename TimePoint_t>
TimePoint_t TimeSeries_<TimePoint_t>::at(std::size_t index) const
{
    if constexpr (std::chrono::treat_as_floating_point_v<rep>) {
        return m_start + m_step * static_cast<rep>(index);
    }
    else {
        // Within [start, end] the offset fits the unsigned ticks even when
        // the signed difference would not.
        using URep = std::make_unsigned_t<rep>;
        const URep offset =
            static_cast<URep>(index) * internal::absValue(m_step.count());
        const auto origin =
            static_cast<URep>(m_start.time_since_epoch().count());
        const URep ticks = m_step > duration::zero() ? origin + offset
                                                     : origin - offset;
        return TimePoint_t{duration{static_cast<rep>(ticks)}};
    }
}

template <typename TimePoint_t>
bool TimeSeries_<TimePoint_t>::withinBound(const TimePoint_t& time) const
{
    const bool ascending = m_step > duration::zero();
    if (isInclusive()) {
        return ascending ? time <= m_end : time >= m_end;
    }
    return ascending ? time < m_end : time > m_end;
}

} // namespace tc
