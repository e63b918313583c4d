#pragma once

#include "fits/types.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace fits {

// Thrown only when the database cannot be opened at all.
class StoreException : public std::runtime_error {
public:
    StoreException(const std::string& message, int code)
        : std::runtime_error(message), code(code) {}
    int code;
};

template<typename T>
using StoreResult = std::expected<T, StoreError>;

// Row upserts autocommit; replace_period() is the only transaction.
class ScoreStore {
public:
    // ":memory:" opens a private in-memory database. A read-only store
    // never creates the file.
    explicit ScoreStore(const std::filesystem::path& path, bool read_only = false);
    ~ScoreStore();

    ScoreStore(const ScoreStore&) = delete;
    ScoreStore(ScoreStore&&) = delete;
    ScoreStore& operator=(const ScoreStore&) = delete;
    ScoreStore& operator=(ScoreStore&&) = delete;

    // Idempotent; creates every table and index.
    StoreResult<void> initialize_schema();

    // Returns false (and logs) on failure.
    bool upsert_player(const Player& player);
    bool upsert_daily_score(const DailyScore& score);

    // Returns the new run id.
    std::optional<int64_t> record_run(const RunAudit& run);

    StoreResult<std::vector<DailyScore>> daily_scores_between(Date first, Date last) const;
    StoreResult<std::optional<std::pair<Date, Date>>> daily_date_range() const;

    // Deletes every stored row of the period and inserts `rows`, atomically.
    StoreResult<void> replace_period(const Period& period,
                                     const std::vector<PeriodAggregate>& rows);

    StoreResult<std::optional<Player>> find_player(const std::string& playfab_id) const;
    StoreResult<std::vector<DailyLeaderboardRow>> daily_leaderboard(Date stat_date) const;
    StoreResult<std::optional<RunAudit>> latest_run(Date stat_date) const;
    StoreResult<std::vector<RunAudit>> runs() const;

    StoreResult<std::vector<PeriodAggregate>> period_rows(const Period& period) const;
    StoreResult<std::vector<PeriodLeaderboardRow>> period_leaderboard(const Period& period) const;
    StoreResult<std::vector<PeriodListing>> list_periods(PeriodGrain grain) const;

    StoreResult<std::vector<AllTimeRow>> all_time_leaderboard() const;
    StoreResult<AllTimeStats> all_time_stats() const;

private:
    sqlite3* db_ = nullptr;

    StoreResult<void> execute(const std::string& sql);
    StoreResult<void> with_transaction(const std::function<StoreResult<void>()>& work);
    StoreError last_error(const std::string& context) const;
};

} // namespace fits
