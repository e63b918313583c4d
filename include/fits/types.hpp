#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fits {

using Date = std::chrono::year_month_day;

// Upstream wire types

struct LinkedAccount {
    std::string platform;
    std::string platform_user_id;
};

struct LeaderboardEntry {
    std::string playfab_id;
    std::optional<std::string> display_name;
    std::optional<std::string> profile_display_name;
    std::vector<LinkedAccount> linked_accounts;
    int position = 0;
    int64_t stat_value = 0;
};

struct LeaderboardPage {
    std::vector<LeaderboardEntry> entries;
    std::optional<int64_t> version;
    bool dry_run = false;
};

enum class FailureKind {
    MissingCredential,
    Transport,
    Unauthorized,
    HttpStatus,
    MalformedBody,
};

struct FetchFailure {
    FailureKind kind = FailureKind::Transport;
    int status_code = 0;
    std::string message;
};

// Persisted types

struct PlayerIdentity {
    std::optional<std::string> display_name;
    std::optional<std::string> platform;
    std::optional<std::string> platform_user_id;
};

struct Player {
    std::string playfab_id;
    std::optional<std::string> display_name;
    std::optional<std::string> platform;
    std::optional<std::string> platform_user_id;
    Date first_seen;
    Date last_seen;
};

struct DailyScore {
    Date stat_date;
    std::string statistic_name;
    std::string playfab_id;
    int position = 0;
    int64_t score = 0;
};

struct RunAudit {
    int64_t id = 0;
    Date stat_date;
    std::string statistic_name;
    std::string fetched_at;
    int entry_count = 0;
    std::string api_version = "v1";
};

enum class PeriodGrain { Week, Month };

struct Period {
    PeriodGrain grain = PeriodGrain::Week;
    Date start;
    Date end;

    bool contains(Date d) const {
        return std::chrono::sys_days{d} >= std::chrono::sys_days{start} &&
               std::chrono::sys_days{d} <= std::chrono::sys_days{end};
    }
    int length_days() const {
        return static_cast<int>(
            (std::chrono::sys_days{end} - std::chrono::sys_days{start}).count()) + 1;
    }
};

struct PeriodAggregate {
    Date period_start;
    Date period_end;
    std::string playfab_id;
    int64_t total_score = 0;
    int days_participated = 0;
    double average_score = 0.0;
    int64_t best_daily_score = 0;
    Date best_daily_date;
    int position = 0;
    std::string calculated_at;
};

// Pipeline results

struct FetchSummary {
    bool success = false;
    bool dry_run = false;
    int total_entries = 0;
    int players_updated = 0;
    int scores_updated = 0;
};

struct DatedFetchSummary {
    Date stat_date;
    std::string statistic_name;
    FetchSummary summary;
};

struct PeriodSummary {
    Period period;
    int players = 0;
    bool skipped = false;
    std::vector<PeriodAggregate> top;
};

struct StoreError {
    int code = 0;
    std::string message;
};

// Read-side rows (joined with player identity)

struct DailyLeaderboardRow {
    DailyScore score;
    Player player;
};

struct PeriodLeaderboardRow {
    PeriodAggregate aggregate;
    Player player;
};

struct PeriodListing {
    Date period_start;
    Date period_end;
    int player_count = 0;
    int64_t top_score = 0;
};

struct AllTimeRow {
    Player player;
    int days_played = 0;
    int64_t total_score = 0;
    double average_score = 0.0;
    int64_t best_daily_score = 0;
    int64_t worst_daily_score = 0;
    Date best_day_date;
    int position = 0;
};

struct AllTimeStats {
    int total_players = 0;
    int total_days = 0;
    std::optional<Date> first_date;
    std::optional<Date> last_date;
    int64_t cumulative_score = 0;
    double average_daily_score = 0.0;
    int64_t highest_score_ever = 0;
};

} // namespace fits
