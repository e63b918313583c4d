#include <gtest/gtest.h>
#include "fits/calendar.hpp"

namespace {

using namespace std::chrono;

fits::Date d(int y, unsigned m, unsigned dd) {
    return fits::Date{year{y}, month{m}, day{dd}};
}

} // namespace

TEST(ParseDate, AcceptsIsoDate) {
    auto parsed = fits::parse_date("2026-01-22");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, d(2026, 1, 22));
}

TEST(ParseDate, RejectsWrongShape) {
    EXPECT_FALSE(fits::parse_date("2026-1-22").has_value());
    EXPECT_FALSE(fits::parse_date("22/01/2026").has_value());
    EXPECT_FALSE(fits::parse_date("").has_value());
    EXPECT_EQ(fits::parse_date("yesterday").error(), "Invalid date format. Use YYYY-MM-DD.");
}

TEST(ParseDate, RejectsImpossibleDay) {
    EXPECT_FALSE(fits::parse_date("2026-02-30").has_value());
    EXPECT_FALSE(fits::parse_date("2025-02-29").has_value());
    EXPECT_TRUE(fits::parse_date("2024-02-29").has_value());
}

TEST(ParseMonth, ResolvesToFirstDay) {
    auto parsed = fits::parse_month("2026-03");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, d(2026, 3, 1));
    EXPECT_FALSE(fits::parse_month("2026-13").has_value());
    EXPECT_FALSE(fits::parse_month("2026-03-01").has_value());
}

TEST(FormatDate, ZeroPads) {
    EXPECT_EQ(fits::format_date(d(2026, 1, 5)), "2026-01-05");
}

TEST(StatisticName, UsesUpstreamDayTokens) {
    // 2026-01-19 is a Monday.
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 19)), "DailyPlay_Mon");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 20)), "DailyPlay_Tues");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 21)), "DailyPlay_Wed");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 22)), "DailyPlay_Thurs");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 23)), "DailyPlay_Fri");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 24)), "DailyPlay_Sat");
    EXPECT_EQ(fits::statistic_name_for(d(2026, 1, 25)), "DailyPlay_Sun");
}

TEST(WeekContaining, RunsSundayToSaturday) {
    auto week = fits::week_containing(d(2026, 1, 22));
    EXPECT_EQ(week.grain, fits::PeriodGrain::Week);
    EXPECT_EQ(week.start, d(2026, 1, 18));
    EXPECT_EQ(week.end, d(2026, 1, 24));
    EXPECT_EQ(week.length_days(), 7);
}

TEST(WeekContaining, SundayAndSaturdayAreEdges) {
    EXPECT_EQ(fits::week_containing(d(2026, 1, 18)).start, d(2026, 1, 18));
    EXPECT_EQ(fits::week_containing(d(2026, 1, 24)).start, d(2026, 1, 18));
    EXPECT_EQ(fits::week_containing(d(2026, 1, 25)).start, d(2026, 1, 25));
}

TEST(WeekContaining, SpansYearBoundary) {
    auto week = fits::week_containing(d(2026, 1, 1));
    EXPECT_EQ(week.start, d(2025, 12, 28));
    EXPECT_EQ(week.end, d(2026, 1, 3));
}

TEST(MonthContaining, CoversWholeMonth) {
    auto month = fits::month_containing(d(2026, 4, 17));
    EXPECT_EQ(month.start, d(2026, 4, 1));
    EXPECT_EQ(month.end, d(2026, 4, 30));
}

TEST(MonthContaining, LeapFebruary) {
    EXPECT_EQ(fits::month_containing(d(2024, 2, 10)).end, d(2024, 2, 29));
    EXPECT_EQ(fits::month_containing(d(2026, 2, 10)).end, d(2026, 2, 28));
    EXPECT_EQ(fits::month_containing(d(2024, 2, 10)).length_days(), 29);
}

TEST(PeriodsCovering, EnumeratesTouchingWeeks) {
    auto weeks = fits::periods_covering(fits::PeriodGrain::Week, d(2026, 1, 22), d(2026, 2, 2));
    ASSERT_EQ(weeks.size(), 3u);
    EXPECT_EQ(weeks[0].start, d(2026, 1, 18));
    EXPECT_EQ(weeks[1].start, d(2026, 1, 25));
    EXPECT_EQ(weeks[2].start, d(2026, 2, 1));
}

TEST(PeriodsCovering, EnumeratesTouchingMonths) {
    auto months = fits::periods_covering(fits::PeriodGrain::Month, d(2025, 12, 31), d(2026, 2, 1));
    ASSERT_EQ(months.size(), 3u);
    EXPECT_EQ(months[0].start, d(2025, 12, 1));
    EXPECT_EQ(months[2].end, d(2026, 2, 28));
}

TEST(PeriodsCovering, EmptyWhenReversed) {
    EXPECT_TRUE(fits::periods_covering(fits::PeriodGrain::Week, d(2026, 2, 1), d(2026, 1, 1)).empty());
}

TEST(DatesBetween, IsInclusive) {
    auto dates = fits::dates_between(d(2026, 2, 27), d(2026, 3, 2));
    ASSERT_EQ(dates.size(), 4u);
    EXPECT_EQ(dates.front(), d(2026, 2, 27));
    EXPECT_EQ(dates.back(), d(2026, 3, 2));
    EXPECT_TRUE(fits::dates_between(d(2026, 3, 2), d(2026, 3, 1)).empty());
}

TEST(Period, ContainsIsInclusive) {
    auto week = fits::week_containing(d(2026, 1, 22));
    EXPECT_TRUE(week.contains(d(2026, 1, 18)));
    EXPECT_TRUE(week.contains(d(2026, 1, 24)));
    EXPECT_FALSE(week.contains(d(2026, 1, 25)));
}

TEST(UtcTimestamp, SecondsResolutionLayout) {
    auto stamp = fits::utc_timestamp();
    ASSERT_EQ(stamp.size(), 19u);
    EXPECT_EQ(stamp[10], ' ');
    EXPECT_EQ(stamp[13], ':');
    EXPECT_EQ(stamp[16], ':');
    EXPECT_TRUE(fits::parse_date(stamp.substr(0, 10)).has_value());
}
