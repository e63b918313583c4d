#include "fits/fetcher.hpp"
#include "fits/calendar.hpp"
#include "fits/logging.hpp"
#include "fits/normalizer.hpp"

namespace fits {

LeaderboardFetcher::LeaderboardFetcher(LeaderboardSource& source, ScoreStore& store,
                                       RequestPacer& pacer, FetchConfig config)
    : source_(source), store_(store), pacer_(pacer), config_(std::move(config)) {}

FetchSummary LeaderboardFetcher::fetch(const std::string& statistic_name, Date stat_date) {
    LOG_INFO("Starting leaderboard fetch: statistic={} date={}",
             statistic_name, format_date(stat_date));

    std::vector<LeaderboardEntry> all;
    int start_position = 0;
    bool first_page_failed = false;

    for (int page = 0; page < config_.max_pages; ++page) {
        LOG_DEBUG("Fetching page: start_position={} max_results={}",
                  start_position, config_.page_size);

        auto result = source_.fetch_page(statistic_name, start_position, config_.page_size);
        if (!result) {
            LOG_ERROR("Failed to fetch leaderboard page at {}: {}",
                      start_position, result.error().message);
            first_page_failed = (page == 0);
            break;
        }

        if (result->dry_run) {
            LOG_INFO("Dry-run mode: no data fetched for {}", format_date(stat_date));
            return {.success = true, .dry_run = true};
        }

        auto& entries = result->entries;
        int page_size = static_cast<int>(entries.size());
        LOG_DEBUG("Page fetched: {} entries", page_size);

        if (page_size == 0) break;

        all.insert(all.end(), entries.begin(), entries.end());
        start_position += page_size;

        if (page_size < config_.page_size) break;

        if (page + 1 == config_.max_pages) {
            LOG_WARN("Page limit of {} reached for {}, stopping", config_.max_pages, statistic_name);
            break;
        }
        pacer_.pause();
    }

    LOG_INFO("Fetch completed: {} entries", all.size());

    auto summary = store_entries(all, statistic_name, stat_date);
    bool rows_written = summary.players_updated == summary.total_entries &&
                        summary.scores_updated == summary.total_entries;
    if (!rows_written) {
        LOG_ERROR("Only {} of {} scores stored for {} {}", summary.scores_updated,
                  summary.total_entries, format_date(stat_date), statistic_name);
    }

    RunAudit run{
        .stat_date = stat_date,
        .statistic_name = statistic_name,
        .entry_count = summary.total_entries,
        .api_version = config_.api_version,
    };
    bool run_recorded = store_.record_run(run).has_value();
    if (!run_recorded) {
        LOG_ERROR("Run audit row not written for {} {}", format_date(stat_date), statistic_name);
    }

    summary.success = !first_page_failed && rows_written && run_recorded;

    return summary;
}

std::vector<DatedFetchSummary> LeaderboardFetcher::fetch_dates(const std::vector<Date>& dates) {
    std::vector<DatedFetchSummary> results;
    for (auto& date : dates) {
        auto statistic = statistic_name_for(date);
        results.push_back({
            .stat_date = date,
            .statistic_name = statistic,
            .summary = fetch(statistic, date),
        });
    }
    return results;
}

FetchSummary LeaderboardFetcher::store_entries(const std::vector<LeaderboardEntry>& entries,
                                               const std::string& statistic_name,
                                               Date stat_date) {
    FetchSummary summary;
    summary.total_entries = static_cast<int>(entries.size());

    for (auto& entry : entries) {
        if (store_.upsert_player(normalize_player(entry, stat_date))) {
            ++summary.players_updated;
        }
        if (store_.upsert_daily_score(normalize_score(entry, statistic_name, stat_date))) {
            ++summary.scores_updated;
        }
    }

    LOG_INFO("Data stored: players_updated={} scores_updated={}",
             summary.players_updated, summary.scores_updated);
    return summary;
}

} // namespace fits
