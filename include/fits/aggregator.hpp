#pragma once

#include "fits/calendar.hpp"
#include "fits/score_store.hpp"
#include "fits/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace fits {

// Groups the daily rows by player and ranks them: total descending, then
// playfab_id ascending. Rows outside `period` are ignored. A best-score
// tie resolves to the earliest date.
std::vector<PeriodAggregate> aggregate_scores(const std::vector<DailyScore>& rows,
                                              const Period& period,
                                              const std::string& calculated_at);

class PeriodAggregator {
public:
    using Clock = std::function<std::string()>;

    PeriodAggregator(ScoreStore& store, PeriodGrain grain, Clock clock = utc_timestamp);

    // Rebuilds the period containing `anchor`. Periods without daily rows
    // are reported as skipped and left untouched.
    StoreResult<PeriodSummary> aggregate(Date anchor);

    // Every period touching the stored daily range, oldest first.
    StoreResult<std::vector<PeriodSummary>> aggregate_all();

    PeriodGrain grain() const { return grain_; }

private:
    ScoreStore& store_;
    PeriodGrain grain_;
    Clock clock_;
};

} // namespace fits
