#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include <tChrono/TimeSeries>

using namespace tc;
using namespace std::chrono_literals;

namespace {
constexpr Duration kTwoHours{2h};
}

TEST(TimeSeries, Exclusive)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    EXPECT_FALSE(series.isInclusive());
    EXPECT_EQ(series.size(), 6);

    int count{0};
    for (const auto& time : series) {
        if (count == 0) {
            EXPECT_EQ(time, start)
                << "Starting epoch of exclusive time series is wrong";
        }
        EXPECT_NE(time, end)
            << "Ending epoch of exclusive time series is wrong";
        EXPECT_EQ(time, start + count * kTwoHours);
        ++count;
    }

    EXPECT_EQ(count, 6) << "Should have six items in this iterator";
    EXPECT_TRUE(series.empty());
    EXPECT_FALSE(series.next().has_value());
    EXPECT_FALSE(series.nextBack().has_value());
}

TEST(TimeSeries, Inclusive)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::inclusive(start, end, kTwoHours);
    EXPECT_TRUE(series.isInclusive());
    EXPECT_EQ(series.size(), 7);

    const auto times = series.collect();
    ASSERT_EQ(times.size(), 7) << "Should have seven items in this iterator";
    EXPECT_EQ(times.front(), start)
        << "Starting epoch of inclusive time series is wrong";
    EXPECT_EQ(times.back(), end)
        << "Ending epoch of inclusive time series is wrong";
    EXPECT_EQ(epoch::toString(times[3]), "2017-01-14T06:00:00 UTC");
}

TEST(TimeSeries, ConstantStep)
{
    const auto start = epoch::fromGregorianUtc(2020, 2, 28, 23, 59, 59, 1);
    const auto end = epoch::fromGregorianUtc(2020, 3, 1, 0, 0, 1);
    constexpr Duration kStep{7min + 3s + 11ns};

    auto series = TimeSeries::inclusive(start, end, kStep);
    const auto times = series.collect();
    ASSERT_GT(times.size(), 2);
    for (size_t i{1}; i < times.size(); ++i) {
        EXPECT_EQ(times[i] - times[i - 1], kStep);
    }
    EXPECT_LE(times.back(), end);
    EXPECT_GT(times.back() + kStep, end);
}

TEST(TimeSeries, CountMatchesTraversal)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    struct Case
    {
        Duration step;
        size_t exclusive;
        size_t inclusive;
    };

    const std::vector<Case> cases{
        {kTwoHours, 6, 7},    {Duration{5h}, 3, 3},  {Duration{12h}, 1, 2},
        {Duration{13h}, 1, 1}, {Duration{7min}, 103, 103},
        {Duration{1s}, 43200, 43201},
    };

    for (const auto& c : cases) {
        auto exclusive = TimeSeries::exclusive(start, end, c.step);
        EXPECT_EQ(exclusive.size(), c.exclusive);
        EXPECT_EQ(exclusive.collect().size(), c.exclusive);

        auto inclusive = TimeSeries::inclusive(start, end, c.step);
        EXPECT_EQ(inclusive.size(), c.inclusive);
        EXPECT_EQ(inclusive.collect().size(), c.inclusive);
    }
}

TEST(TimeSeries, SizeHint)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    auto [lower, upper] = series.sizeHint();
    EXPECT_EQ(lower, 6);
    EXPECT_EQ(upper, 7);

    series.next();
    std::tie(lower, upper) = series.sizeHint();
    EXPECT_EQ(lower, series.size());
    EXPECT_EQ(lower, 5);
    EXPECT_EQ(upper, 6);
    EXPECT_EQ(series.total(), 6);
}

TEST(TimeSeries, NextBack)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    EXPECT_EQ(series.nextBack(), end - kTwoHours);

    int count{1};
    while (const auto time = series.nextBack()) {
        EXPECT_GE(*time, start);
        ++count;
    }
    EXPECT_EQ(count, 6);

    auto inclusive = TimeSeries::inclusive(start, end, kTwoHours);
    EXPECT_EQ(inclusive.nextBack(), end);
}

TEST(TimeSeries, InterleavedTraversalMeetsInTheMiddle)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    EXPECT_EQ(series.next(), start);
    EXPECT_EQ(series.nextBack(), start + 5 * kTwoHours);
    EXPECT_EQ(series.next(), start + kTwoHours);
    EXPECT_EQ(series.size(), 3);
    EXPECT_EQ(series.nextBack(), start + 4 * kTwoHours);
    EXPECT_EQ(series.nextBack(), start + 3 * kTwoHours);
    EXPECT_EQ(series.next(), start + 2 * kTwoHours);
    EXPECT_TRUE(series.empty());
    EXPECT_FALSE(series.next().has_value());
    EXPECT_FALSE(series.nextBack().has_value());
}

TEST(TimeSeries, SameStartAndEnd)
{
    const auto start = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto exclusive = TimeSeries::exclusive(start, start, kTwoHours);
    EXPECT_TRUE(exclusive.empty());
    EXPECT_FALSE(exclusive.next().has_value());

    auto inclusive = TimeSeries::inclusive(start, start, -kTwoHours);
    EXPECT_EQ(inclusive.size(), 1);
    EXPECT_EQ(inclusive.next(), start);
    EXPECT_FALSE(inclusive.next().has_value());
}

TEST(TimeSeries, Descending)
{
    const auto start = epoch::fromGregorianUtcAtNoon(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);

    auto exclusive = TimeSeries::exclusive(start, end, -kTwoHours);
    const auto times = exclusive.collect();
    ASSERT_EQ(times.size(), 6);
    EXPECT_EQ(times.front(), start);
    EXPECT_EQ(times.back(), end + kTwoHours);
    // Bounded along the step: never after start, never at or before end
    for (const auto& time : times) {
        EXPECT_LE(time, start);
        EXPECT_GT(time, end);
    }

    auto inclusive = TimeSeries::inclusive(start, end, -kTwoHours);
    EXPECT_EQ(inclusive.size(), 7);
    EXPECT_EQ(inclusive.nextBack(), end);
    EXPECT_EQ(inclusive.next(), start);
}

TEST(TimeSeries, InvalidStep)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    EXPECT_THROW(TimeSeries::exclusive(start, end, Duration::zero()),
                 std::invalid_argument);
    EXPECT_THROW(TimeSeries::inclusive(start, start, Duration::zero()),
                 std::invalid_argument);
    EXPECT_THROW(TimeSeries::exclusive(start, end, -kTwoHours),
                 std::invalid_argument);
    EXPECT_THROW(TimeSeries::inclusive(end, start, kTwoHours),
                 std::invalid_argument);
}

TEST(TimeSeries, CopyIsIndependent)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    const auto copy = series;
    series.next();
    series.nextBack();

    EXPECT_EQ(series.size(), 4);
    EXPECT_EQ(copy.size(), 6);
    EXPECT_EQ(copy.startTime(), start);
    EXPECT_EQ(copy.endTime(), end);
    EXPECT_EQ(copy.step(), kTwoHours);
    EXPECT_EQ(copy.boundary(), Boundary::Exclusive);
}

TEST(TimeSeries, SaturatedCount)
{
    constexpr auto kMaxCount = std::numeric_limits<size_t>::max();

    auto exclusive =
        TimeSeries::exclusive(Epoch::min(), Epoch::max(), Duration{1});
    EXPECT_EQ(exclusive.size(), kMaxCount);
    EXPECT_FALSE(exclusive.sizeHint().second.has_value());
    EXPECT_EQ(exclusive.next(), Epoch::min());
    EXPECT_EQ(exclusive.nextBack(), Epoch::max() - Duration{1});

    // One element more than size_t holds, the end boundary is left out
    auto inclusive =
        TimeSeries::inclusive(Epoch::min(), Epoch::max(), Duration{1});
    EXPECT_EQ(inclusive.size(), kMaxCount);
    EXPECT_FALSE(inclusive.sizeHint().second.has_value());
    EXPECT_EQ(inclusive.nextBack(), Epoch::max() - Duration{1});
    EXPECT_EQ(inclusive.next(), Epoch::min());
}

TEST(TimeSeries, FloatingPointTicks)
{
    using SecondsTime =
        std::chrono::time_point<std::chrono::system_clock, time::seconds_d>;
    const SecondsTime start{};
    const SecondsTime end{time::seconds_d{1.}};
    const time::seconds_d step{0.1};

    auto exclusive = TimeSeries_<SecondsTime>::exclusive(start, end, step);
    EXPECT_EQ(exclusive.size(), 10);
    EXPECT_EQ(exclusive.collect().size(), 10);

    auto inclusive = TimeSeries_<SecondsTime>::inclusive(start, end, step);
    EXPECT_EQ(inclusive.size(), 11);
    EXPECT_EQ(inclusive.nextBack(), end);

    // 0.9 / 0.3 rounds above 3, the boundary check settles the count
    const SecondsTime end2{time::seconds_d{0.9}};
    const time::seconds_d step2{0.3};
    for (const auto boundary : {Boundary::Exclusive, Boundary::Inclusive}) {
        TimeSeries_<SecondsTime> series{start, end2, step2, boundary};
        const auto size = series.size();
        EXPECT_EQ(series.collect().size(), size);
    }

    EXPECT_THROW(TimeSeries_<SecondsTime>::exclusive(
                     start, end, time::seconds_d{std::nan("")}),
                 std::invalid_argument);
}

TEST(TimeSeries, Print)
{
    const auto start = epoch::fromGregorianUtcAtMidnight(2017, 1, 14);
    const auto end = epoch::fromGregorianUtcAtNoon(2017, 1, 14);

    auto series = TimeSeries::exclusive(start, end, kTwoHours);
    series.next();

    std::ostringstream oss;
    oss << series;
    EXPECT_EQ(oss.str(),
              "TimeSeries(Exclusive, 2017-01-14T00:00:00 UTC -> "
              "2017-01-14T12:00:00 UTC, step 7200s, 5/6 remaining)");
}
