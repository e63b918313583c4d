#include "fits/aggregator.hpp"
#include "fits/calendar.hpp"
#include "fits/logging.hpp"
#include <algorithm>
#include <chrono>
#include <map>

namespace fits {

std::vector<PeriodAggregate> aggregate_scores(const std::vector<DailyScore>& rows,
                                              const Period& period,
                                              const std::string& calculated_at) {
    struct Bucket {
        int64_t total = 0;
        int days = 0;
        int64_t best = 0;
        Date best_date;
    };

    // std::map keeps buckets in playfab_id order, which stable_sort preserves on ties.
    std::map<std::string, Bucket> buckets;

    for (auto& row : rows) {
        if (!period.contains(row.stat_date)) continue;

        auto [it, inserted] = buckets.try_emplace(row.playfab_id);
        auto& b = it->second;
        auto day = std::chrono::sys_days{row.stat_date};

        if (inserted || row.score > b.best ||
            (row.score == b.best && day < std::chrono::sys_days{b.best_date})) {
            b.best = row.score;
            b.best_date = row.stat_date;
        }
        b.total += row.score;
        b.days++;
    }

    std::vector<PeriodAggregate> result;
    result.reserve(buckets.size());
    for (auto& [playfab_id, b] : buckets) {
        result.push_back({
            .period_start = period.start,
            .period_end = period.end,
            .playfab_id = playfab_id,
            .total_score = b.total,
            .days_participated = b.days,
            .average_score = static_cast<double>(b.total) / b.days,
            .best_daily_score = b.best,
            .best_daily_date = b.best_date,
            .calculated_at = calculated_at,
        });
    }

    std::ranges::stable_sort(result, std::ranges::greater{}, &PeriodAggregate::total_score);

    for (int i = 0; i < static_cast<int>(result.size()); ++i) {
        result[i].position = i;
    }
    return result;
}

PeriodAggregator::PeriodAggregator(ScoreStore& store, PeriodGrain grain, Clock clock)
    : store_(store), grain_(grain), clock_(std::move(clock)) {}

StoreResult<PeriodSummary> PeriodAggregator::aggregate(Date anchor) {
    auto period = period_containing(grain_, anchor);
    PeriodSummary summary{.period = period};

    LOG_INFO("Calculating {}ly leaderboard: {} to {}", grain_name(grain_),
             format_date(period.start), format_date(period.end));

    auto rows = store_.daily_scores_between(period.start, period.end);
    if (!rows) {
        LOG_ERROR("Reading daily scores failed: {}", rows.error().message);
        return std::unexpected(rows.error());
    }

    if (rows->empty()) {
        LOG_INFO("No data found for {} starting {}", grain_name(grain_), format_date(period.start));
        summary.skipped = true;
        return summary;
    }

    auto aggregates = aggregate_scores(*rows, period, clock_());

    if (auto replaced = store_.replace_period(period, aggregates); !replaced) {
        LOG_ERROR("Storing {} {} failed, transaction rolled back: {}",
                  grain_name(grain_), format_date(period.start), replaced.error().message);
        return std::unexpected(replaced.error());
    }

    summary.players = static_cast<int>(aggregates.size());
    auto top_n = std::min<size_t>(3, aggregates.size());
    summary.top.assign(aggregates.begin(), aggregates.begin() + top_n);

    LOG_INFO("Stored {} {} rows for {}", summary.players, grain_name(grain_),
             format_date(period.start));
    return summary;
}

StoreResult<std::vector<PeriodSummary>> PeriodAggregator::aggregate_all() {
    auto range = store_.daily_date_range();
    if (!range) return std::unexpected(range.error());

    std::vector<PeriodSummary> summaries;
    if (!range->has_value()) {
        LOG_INFO("No daily data in database");
        return summaries;
    }

    auto [first, last] = **range;
    LOG_INFO("Data range: {} to {}", format_date(first), format_date(last));

    for (auto& period : periods_covering(grain_, first, last)) {
        auto summary = aggregate(period.start);
        if (!summary) return std::unexpected(summary.error());
        summaries.push_back(std::move(*summary));
    }
    return summaries;
}

} // namespace fits
