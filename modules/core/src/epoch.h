#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "tc_core_global.h"
#include "timeutils.h"

namespace tc {

// UTC instant with nanosecond ticks since 1970-01-01T00:00:00 UTC. Leap
// seconds are not counted, representable years are [1678, 2261].
using Epoch = std::chrono::sys_time<Duration>;

namespace epoch {

/// @brief Build an Epoch from a Gregorian UTC date and time of day.
///
/// @throw std::invalid_argument if the date does not exist, any time field
/// is out of range or the year is not representable.
TC_CORE_API Epoch fromGregorianUtc(int year, unsigned month, unsigned day,
                                   unsigned hour = 0, unsigned minute = 0,
                                   unsigned second = 0, unsigned nanos = 0);

TC_CORE_API Epoch fromGregorianUtcAtMidnight(int year, unsigned month,
                                             unsigned day);

TC_CORE_API Epoch fromGregorianUtcAtNoon(int year, unsigned month,
                                         unsigned day);

/// @brief Parse a Gregorian UTC string.
///
/// Accepted: "YYYY-MM-DD" optionally followed by "THH:MM", ":SS" and up to 9
/// fractional digits. A space may replace 'T', a trailing "Z" or "UTC" is
/// allowed. e.g. "2022-07-14T02:56:11.228271007 UTC".
TC_CORE_API std::optional<Epoch> fromString(std::string_view str);

/// Format as "YYYY-MM-DDTHH:MM:SS[.fffffffff] UTC", fraction only if nonzero.
TC_CORE_API std::string toString(const Epoch& epoch);

} // namespace epoch

} // namespace tc
