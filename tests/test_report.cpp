#include <gtest/gtest.h>
#include "fits/report.hpp"
#include <sstream>

namespace {

using namespace std::chrono;

fits::Date d(int y, unsigned m, unsigned dd) {
    return fits::Date{year{y}, month{m}, day{dd}};
}

} // namespace

TEST(CsvField, PlainValueUnquoted) {
    EXPECT_EQ(fits::csv_field("Alpha"), "Alpha");
}

TEST(CsvField, QuotesSeparatorsAndEscapesQuotes) {
    EXPECT_EQ(fits::csv_field("Smith, J"), "\"Smith, J\"");
    EXPECT_EQ(fits::csv_field("the \"best\""), "\"the \"\"best\"\"\"");
    EXPECT_EQ(fits::csv_field("two\nlines"), "\"two\nlines\"");
}

TEST(PlayerLabel, FallsBackToPlayfabId) {
    fits::Player p{.playfab_id = "ABC"};
    EXPECT_EQ(fits::player_label(p), "ABC");
    p.display_name = "Alpha";
    EXPECT_EQ(fits::player_label(p), "Alpha");
}

TEST(DailyCsv, HeaderAndRows) {
    fits::Player p{.playfab_id = "P1", .display_name = "Doe, Jane", .platform = "GOG"};
    fits::DailyScore s{.stat_date = d(2026, 1, 22), .statistic_name = "DailyPlay_Thurs",
                       .playfab_id = "P1", .position = 0, .score = 42};

    std::ostringstream out;
    fits::write_daily_csv(out, {{s, p}});

    EXPECT_EQ(out.str(),
              "stat_date,statistic_name,position,playfab_id,display_name,platform,platform_user_id,score\n"
              "2026-01-22,DailyPlay_Thurs,0,P1,\"Doe, Jane\",GOG,,42\n");
}

TEST(PeriodCsv, FormatsAverage) {
    fits::PeriodAggregate a{.period_start = d(2026, 1, 18), .period_end = d(2026, 1, 24),
                            .playfab_id = "P1", .total_score = 10, .days_participated = 3,
                            .average_score = 10.0 / 3, .best_daily_score = 5,
                            .best_daily_date = d(2026, 1, 20), .position = 0};
    std::ostringstream out;
    fits::write_period_csv(out, {{a, fits::Player{.playfab_id = "P1"}}});

    auto text = out.str();
    auto row = text.substr(text.find('\n') + 1);
    EXPECT_EQ(row, "2026-01-18,2026-01-24,0,P1,,10,3,3.33,5,2026-01-20\n");
}

TEST(AllTimeCsv, EmptyHasHeaderOnly) {
    std::ostringstream out;
    fits::write_all_time_csv(out, {});
    EXPECT_EQ(out.str(),
              "position,playfab_id,display_name,days_played,total_score,average_score,"
              "best_daily_score,worst_daily_score,best_day_date\n");
}
