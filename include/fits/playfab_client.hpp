#pragma once

#include "fits/config.hpp"
#include "fits/types.hpp"
#include <expected>
#include <string>
#include <nlohmann/json.hpp>

namespace fits {

using PageResult = std::expected<LeaderboardPage, FetchFailure>;

class LeaderboardSource {
public:
    virtual ~LeaderboardSource() = default;

    virtual PageResult fetch_page(const std::string& statistic_name,
                                  int start_position, int max_results) = 0;

    virtual PageResult fetch_around_player(const std::string& statistic_name,
                                           const std::string& playfab_id,
                                           int max_results) = 0;
};

// Talks to the PlayFab Client API. In dry-run mode nothing leaves the
// process: the request is logged and a page flagged dry_run comes back.
class PlayFabClient : public LeaderboardSource {
public:
    explicit PlayFabClient(PlayFabConfig config);

    PageResult fetch_page(const std::string& statistic_name,
                          int start_position, int max_results) override;

    PageResult fetch_around_player(const std::string& statistic_name,
                                   const std::string& playfab_id,
                                   int max_results) override;

    bool dry_run() const { return !config_.execute_requests; }

private:
    PlayFabConfig config_;

    PageResult post(const std::string& endpoint, const nlohmann::json& payload);
};

nlohmann::json leaderboard_request(const std::string& statistic_name,
                                   int start_position, int max_results);

nlohmann::json around_player_request(const std::string& statistic_name,
                                     const std::string& playfab_id, int max_results);

// Maps an HTTP status and body to a page or a failure; no I/O.
PageResult interpret_response(int status, const std::string& body);

LeaderboardEntry parse_entry(const nlohmann::json& j);

std::string failure_kind_name(FailureKind kind);

} // namespace fits
