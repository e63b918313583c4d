#pragma once

#include "fits/config.hpp"
#include "fits/playfab_client.hpp"
#include "fits/request_pacer.hpp"
#include "fits/score_store.hpp"
#include "fits/types.hpp"
#include <string>
#include <vector>

namespace fits {

// Pages through one statistic until a short or empty page and stores the result.
class LeaderboardFetcher {
public:
    LeaderboardFetcher(LeaderboardSource& source, ScoreStore& store,
                       RequestPacer& pacer, FetchConfig config = {});

    FetchSummary fetch(const std::string& statistic_name, Date stat_date);

    // One fetch per date, statistic derived from the weekday.
    std::vector<DatedFetchSummary> fetch_dates(const std::vector<Date>& dates);

private:
    LeaderboardSource& source_;
    ScoreStore& store_;
    RequestPacer& pacer_;
    FetchConfig config_;

    FetchSummary store_entries(const std::vector<LeaderboardEntry>& entries,
                               const std::string& statistic_name, Date stat_date);
};

} // namespace fits
