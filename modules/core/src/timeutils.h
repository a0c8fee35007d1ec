#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

#include "tc_core_global.h"

namespace tc {

// Exact integer ticks, the finest unit an Epoch can express.
using Duration = std::chrono::nanoseconds;

namespace time {

using seconds_d = std::chrono::duration<double, std::chrono::seconds::period>;
static_assert(std::chrono::treat_as_floating_point_v<seconds_d::rep>,
              "seconds_d's rep required to be floating point");

/// @brief Real-valued seconds of a duration, whatever its tick type.
template <typename Rep, typename Period>
inline constexpr double toSeconds(const std::chrono::duration<Rep, Period>& d)
{
    return std::chrono::duration_cast<seconds_d>(d).count();
}

/// @brief Scale a duration by a real factor, rounded to the nearest tick.
///
/// @warning The tick count goes through a double, durations longer than
/// 2^53 ns (about 104 days) may lose their last nanoseconds.
inline Duration scaled(Duration d, double factor)
{
    return Duration{std::llround(static_cast<double>(d.count()) * factor)};
}

/// @brief Parse a duration written as "<value> <unit>", e.g. "2 h", "0.5us".
///
/// Supported units: ns, us, ms, s, min, h, d. The space between value and
/// unit is optional. Returns std::nullopt on malformed input or when the
/// value does not fit in a Duration.
TC_CORE_API std::optional<Duration> durationFromString(std::string_view str);

} // namespace time

} // namespace tc
