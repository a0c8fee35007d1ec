#include "timeutils.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>

#include "util_string.h"

namespace tc {

namespace {

struct DurationUnit
{
    std::string_view name;
    int64_t ns;
};

constexpr std::array kDurationUnits{
    DurationUnit{"ns", 1},
    DurationUnit{"us", 1'000},
    DurationUnit{"ms", 1'000'000},
    DurationUnit{"s", 1'000'000'000},
    DurationUnit{"min", 60'000'000'000},
    DurationUnit{"h", 3'600'000'000'000},
    DurationUnit{"d", 86'400'000'000'000},
};

// Exclusive, 2^63 is exactly representable as double
constexpr double kMaxDurationNs{
    static_cast<double>(std::numeric_limits<Duration::rep>::max())};

} // namespace

std::optional<Duration> time::durationFromString(std::string_view str)
{
    str = str::Trim(str);
    if (str.empty()) {
        return {};
    }

    const char* first = str.data();
    const char* last = str.data() + str.size();

    double value{0.};
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{}) {
        return {};
    }

    const auto unit = str::ToLower(
        str::Trim({ptr, static_cast<std::size_t>(last - ptr)}));
    const auto found =
        std::find_if(kDurationUnits.cbegin(), kDurationUnits.cend(),
                     [&unit](const auto& u) { return u.name == unit; });
    if (found == kDurationUnits.cend()) {
        return {};
    }

    const double ns = value * static_cast<double>(found->ns);
    if (!std::isfinite(ns) || std::abs(ns) >= kMaxDurationNs) {
        return {};
    }

    return Duration{std::llround(ns)};
}

} // namespace tc
