#include "epoch.h"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "util_string.h"

namespace tc {

namespace {

using namespace std::chrono;

// Years fully covered by int64 nanoseconds around 1970
constexpr int kMinYear{1678};
constexpr int kMaxYear{2261};

constexpr unsigned kNanosPerSecond{1'000'000'000};
constexpr std::size_t kMaxFractionDigits{9};

std::optional<Epoch> makeEpoch(int year, unsigned month, unsigned day,
                               unsigned hour, unsigned minute, unsigned second,
                               unsigned nanos)
{
    if (year < kMinYear || year > kMaxYear) {
        return {};
    }

    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                             std::chrono::day{day}};
    if (!ymd.ok()) {
        return {};
    }

    // No leap second
    if (hour >= 24 || minute >= 60 || second >= 60 ||
        nanos >= kNanosPerSecond) {
        return {};
    }

    return Epoch{sys_days{ymd}} + hours{hour} + minutes{minute} +
           seconds{second} + nanoseconds{nanos};
}

bool readFixed(std::string_view& str, std::size_t digits, unsigned& value)
{
    if (digits == 0 || str.size() < digits) {
        return false;
    }

    const char* last = str.data() + digits;
    const auto [ptr, ec] = std::from_chars(str.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }

    str.remove_prefix(digits);
    return true;
}

bool consume(std::string_view& str, char c)
{
    if (str.empty() || str.front() != c) {
        return false;
    }

    str.remove_prefix(1);
    return true;
}

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

} // namespace

Epoch epoch::fromGregorianUtc(int year, unsigned month, unsigned day,
                              unsigned hour, unsigned minute, unsigned second,
                              unsigned nanos)
{
    const auto epoch =
        makeEpoch(year, month, day, hour, minute, second, nanos);
    if (!epoch) {
        throw std::invalid_argument("Invalid Gregorian UTC date time");
    }

    return *epoch;
}

Epoch epoch::fromGregorianUtcAtMidnight(int year, unsigned month, unsigned day)
{
    return fromGregorianUtc(year, month, day);
}

Epoch epoch::fromGregorianUtcAtNoon(int year, unsigned month, unsigned day)
{
    return fromGregorianUtc(year, month, day, 12);
}

std::optional<Epoch> epoch::fromString(std::string_view str)
{
    str = str::Trim(str);

    unsigned year{0}, month{0}, day{0};
    if (!readFixed(str, 4, year) || !consume(str, '-') ||
        !readFixed(str, 2, month) || !consume(str, '-') ||
        !readFixed(str, 2, day)) {
        return {};
    }

    unsigned hour{0}, minute{0}, second{0}, nanos{0};
    const bool hasTime =
        !str.empty() &&
        (str.front() == 'T' ||
         (str.front() == ' ' && str.size() > 1 && isDigit(str[1])));
    if (hasTime) {
        str.remove_prefix(1);
        if (!readFixed(str, 2, hour) || !consume(str, ':') ||
            !readFixed(str, 2, minute)) {
            return {};
        }

        if (consume(str, ':')) {
            if (!readFixed(str, 2, second)) {
                return {};
            }

            if (consume(str, '.')) {
                std::size_t digits{0};
                while (digits < str.size() && isDigit(str[digits])) {
                    ++digits;
                }
                if (digits > kMaxFractionDigits ||
                    !readFixed(str, digits, nanos)) {
                    return {};
                }
                for (auto i{digits}; i < kMaxFractionDigits; ++i) {
                    nanos *= 10;
                }
            }
        }
    }

    str = str::Trim(str);
    if (!str.empty() && str != "Z" && str != "UTC") {
        return {};
    }

    return makeEpoch(static_cast<int>(year), month, day, hour, minute, second,
                     nanos);
}

std::string epoch::toString(const Epoch& epoch)
{
    const auto midnight = std::chrono::floor<std::chrono::days>(epoch);
    const std::chrono::year_month_day ymd{midnight};
    const std::chrono::hh_mm_ss hms{epoch - midnight};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
        << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << hms.hours().count() << ':' << std::setw(2)
        << hms.minutes().count() << ':' << std::setw(2)
        << hms.seconds().count();
    if (const auto fraction = hms.subseconds().count(); fraction != 0) {
        oss << '.' << std::setw(static_cast<int>(kMaxFractionDigits))
            << fraction;
    }
    oss << " UTC";

    return oss.str();
}

} // namespace tc
