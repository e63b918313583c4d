#include <gtest/gtest.h>
#include "fits/calendar.hpp"
#include "fits/fetcher.hpp"
#include <deque>
#include <filesystem>
#include <sqlite3.h>

namespace {

using namespace std::chrono;

fits::Date d(int y, unsigned m, unsigned dd) {
    return fits::Date{year{y}, month{m}, day{dd}};
}

// Serves scripted pages in order and records every request.
class ScriptedSource : public fits::LeaderboardSource {
public:
    std::deque<fits::PageResult> pages;
    std::vector<int> requested_starts;
    std::vector<std::string> requested_statistics;

    fits::PageResult fetch_page(const std::string& statistic_name,
                                int start_position, int) override {
        requested_starts.push_back(start_position);
        requested_statistics.push_back(statistic_name);
        if (pages.empty()) return fits::LeaderboardPage{};
        auto next = pages.front();
        pages.pop_front();
        return next;
    }

    fits::PageResult fetch_around_player(const std::string&, const std::string&, int) override {
        return fits::LeaderboardPage{};
    }
};

fits::LeaderboardPage page_of(int count, int first_position = 0) {
    fits::LeaderboardPage page;
    for (int i = 0; i < count; ++i) {
        int pos = first_position + i;
        page.entries.push_back({
            .playfab_id = "P" + std::to_string(pos),
            .display_name = "Player " + std::to_string(pos),
            .linked_accounts = {{"Steam", "S" + std::to_string(pos)}},
            .position = pos,
            .stat_value = 1000 - pos,
        });
    }
    return page;
}

fits::FetchFailure failure(fits::FailureKind kind) {
    return {kind, 0, "scripted failure"};
}

class FetcherTest : public ::testing::Test {
protected:
    fits::ScoreStore store{":memory:"};
    ScriptedSource source;
    std::vector<milliseconds> sleeps;
    fits::RequestPacer pacer{milliseconds(100),
                             [this](milliseconds ms) { sleeps.push_back(ms); }};
    fits::FetchConfig config{.page_size = 3};

    void SetUp() override {
        ASSERT_TRUE(store.initialize_schema().has_value());
    }

    size_t stored_scores(fits::Date date) {
        auto rows = store.daily_scores_between(date, date);
        return rows ? rows->size() : 0;
    }

    size_t stored_runs() {
        auto runs = store.runs();
        return runs ? runs->size() : 0;
    }
};

} // namespace

TEST_F(FetcherTest, StopsOnShortPage) {
    source.pages = {page_of(3, 0), page_of(3, 3), page_of(1, 6)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_TRUE(summary.success);
    EXPECT_FALSE(summary.dry_run);
    EXPECT_EQ(summary.total_entries, 7);
    EXPECT_EQ(summary.players_updated, 7);
    EXPECT_EQ(summary.scores_updated, 7);
    EXPECT_EQ(source.requested_starts, (std::vector<int>{0, 3, 6}));
    EXPECT_EQ(sleeps.size(), 2u); // between pages only
    EXPECT_EQ(stored_scores(d(2026, 1, 22)), 7u);
}

TEST_F(FetcherTest, FullPageThenEmptyPage) {
    source.pages = {page_of(3, 0), page_of(0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_TRUE(summary.success);
    EXPECT_EQ(summary.total_entries, 3);
    EXPECT_EQ(source.requested_starts.size(), 2u);
    EXPECT_EQ(pacer.pauses(), 1);
}

TEST_F(FetcherTest, EmptyLeaderboardStillAudited) {
    source.pages = {page_of(0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_TRUE(summary.success);
    EXPECT_EQ(summary.total_entries, 0);
    ASSERT_EQ(stored_runs(), 1u);
    EXPECT_EQ(store.runs()->front().entry_count, 0);
}

TEST_F(FetcherTest, LaterPageFailureKeepsPartialData) {
    source.pages = {page_of(3, 0), std::unexpected(failure(fits::FailureKind::HttpStatus))};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_TRUE(summary.success);
    EXPECT_EQ(summary.total_entries, 3);
    EXPECT_EQ(stored_scores(d(2026, 1, 22)), 3u);
    EXPECT_EQ(stored_runs(), 1u);
}

TEST_F(FetcherTest, FirstPageFailureIsUnsuccessful) {
    source.pages = {std::unexpected(failure(fits::FailureKind::Unauthorized))};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.total_entries, 0);
    EXPECT_EQ(stored_runs(), 1u);
}

TEST_F(FetcherTest, DryRunWritesNothing) {
    source.pages = {fits::LeaderboardPage{.entries = {}, .version = 0, .dry_run = true}};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_TRUE(summary.success);
    EXPECT_TRUE(summary.dry_run);
    EXPECT_EQ(summary.total_entries, 0);
    EXPECT_EQ(summary.players_updated, 0);
    EXPECT_EQ(stored_runs(), 0u);
    EXPECT_EQ(stored_scores(d(2026, 1, 22)), 0u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(FetcherTest, RefetchIsIdempotent) {
    source.pages = {page_of(2, 0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);
    fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));
    auto first = store.daily_scores_between(d(2026, 1, 22), d(2026, 1, 22));
    ASSERT_TRUE(first.has_value());

    source.pages = {page_of(2, 0)};
    EXPECT_TRUE(fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22)).success);
    auto second = store.daily_scores_between(d(2026, 1, 22), d(2026, 1, 22));
    ASSERT_TRUE(second.has_value());

    ASSERT_EQ(first->size(), 2u);
    ASSERT_EQ(second->size(), first->size());
    for (size_t i = 0; i < first->size(); ++i) {
        EXPECT_EQ((*second)[i].playfab_id, (*first)[i].playfab_id);
        EXPECT_EQ((*second)[i].statistic_name, (*first)[i].statistic_name);
        EXPECT_EQ((*second)[i].position, (*first)[i].position);
        EXPECT_EQ((*second)[i].score, (*first)[i].score);
    }
    EXPECT_EQ((*second)[1].playfab_id, "P1");
    EXPECT_EQ((*second)[1].score, 999);
    EXPECT_EQ(stored_runs(), 2u);
}

TEST_F(FetcherTest, RefetchReplacesChangedScores) {
    source.pages = {page_of(2, 0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);
    fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    auto moved = page_of(2, 0);
    std::swap(moved.entries[0].playfab_id, moved.entries[1].playfab_id);
    moved.entries[0].stat_value = 1500;
    source.pages = {moved};
    fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    auto rows = store.daily_scores_between(d(2026, 1, 22), d(2026, 1, 22));
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[0].playfab_id, "P1");
    EXPECT_EQ((*rows)[0].position, 0);
    EXPECT_EQ((*rows)[0].score, 1500);
    EXPECT_EQ((*rows)[1].playfab_id, "P0");
    EXPECT_EQ((*rows)[1].position, 1);
}

TEST(FetcherWrites, MissingSchemaIsUnsuccessful) {
    fits::ScoreStore bare(":memory:");
    ScriptedSource source;
    source.pages = {page_of(2, 0)};
    fits::RequestPacer pacer(milliseconds(0));
    fits::LeaderboardFetcher fetcher(source, bare, pacer, {.page_size = 3});

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.total_entries, 2);
    EXPECT_EQ(summary.players_updated, 0);
    EXPECT_EQ(summary.scores_updated, 0);
}

namespace {

// daily_scores carries a CHECK that rejects P1, so one row fails mid-batch.
class RejectingStoreTest : public ::testing::Test {
protected:
    std::filesystem::path db_path =
        std::filesystem::temp_directory_path() / "fits_fetcher_rejecting.db";
    ScriptedSource source;
    fits::RequestPacer pacer{milliseconds(0)};

    void SetUp() override {
        std::filesystem::remove(db_path);
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
        int rc = sqlite3_exec(db, R"sql(
            CREATE TABLE daily_scores (
                stat_date DATE NOT NULL,
                statistic_name TEXT NOT NULL,
                position INTEGER NOT NULL,
                playfab_id TEXT NOT NULL CHECK (playfab_id <> 'P1'),
                score INTEGER NOT NULL,
                PRIMARY KEY (stat_date, playfab_id)
            );
        )sql", nullptr, nullptr, nullptr);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK);
    }

    void TearDown() override {
        std::filesystem::remove(db_path);
    }
};

} // namespace

TEST_F(RejectingStoreTest, OneFailedRowDoesNotStopTheBatch) {
    fits::ScoreStore store(db_path);
    ASSERT_TRUE(store.initialize_schema().has_value());
    source.pages = {page_of(3, 0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, {.page_size = 3});

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.total_entries, 3);
    EXPECT_EQ(summary.players_updated, 3);
    EXPECT_EQ(summary.scores_updated, summary.total_entries - 1);

    auto rows = store.daily_scores_between(d(2026, 1, 22), d(2026, 1, 22));
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[0].playfab_id, "P0");
    EXPECT_EQ((*rows)[1].playfab_id, "P2");
    EXPECT_EQ((*rows)[1].score, 998);

    auto runs = store.runs();
    ASSERT_TRUE(runs.has_value());
    ASSERT_EQ(runs->size(), 1u);
    EXPECT_EQ(runs->front().entry_count, 3);
}

TEST_F(FetcherTest, PageLimitStopsPagination) {
    config.max_pages = 2;
    source.pages = {page_of(3, 0), page_of(3, 3), page_of(3, 6)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto summary = fetcher.fetch("DailyPlay_Thurs", d(2026, 1, 22));

    EXPECT_EQ(summary.total_entries, 6);
    EXPECT_EQ(source.requested_starts.size(), 2u);
    EXPECT_EQ(pacer.pauses(), 1);
}

TEST_F(FetcherTest, FetchDatesDerivesStatistic) {
    source.pages = {page_of(1, 0), page_of(1, 0)};
    fits::LeaderboardFetcher fetcher(source, store, pacer, config);

    auto results = fetcher.fetch_dates({d(2026, 1, 22), d(2026, 1, 23)});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].statistic_name, "DailyPlay_Thurs");
    EXPECT_EQ(results[1].statistic_name, "DailyPlay_Fri");
    EXPECT_EQ(source.requested_statistics,
              (std::vector<std::string>{"DailyPlay_Thurs", "DailyPlay_Fri"}));
    EXPECT_TRUE(results[1].summary.success);
    EXPECT_EQ(stored_scores(d(2026, 1, 23)), 1u);
}

TEST(RequestPacer, ZeroDelayNeverSleeps) {
    int calls = 0;
    fits::RequestPacer pacer(milliseconds(0), [&](milliseconds) { ++calls; });
    pacer.pause();
    pacer.pause();
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(pacer.pauses(), 0);
}

TEST(RequestPacer, SleepsForConfiguredDelay) {
    std::vector<milliseconds> sleeps;
    fits::RequestPacer pacer(milliseconds(250), [&](milliseconds ms) { sleeps.push_back(ms); });
    pacer.pause();
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], milliseconds(250));
}
