#include "fits/playfab_client.hpp"
#include "fits/logging.hpp"
#include <httplib.h>

namespace fits {

namespace {

std::optional<std::string> optional_str(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    return optional_str(j, key).value_or(fallback);
}

nlohmann::json profile_constraints() {
    return {
        {"ShowDisplayName", true},
        {"ShowLinkedAccounts", true},
    };
}

} // namespace

std::string failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::MissingCredential: return "missing-credential";
        case FailureKind::Transport: return "transport";
        case FailureKind::Unauthorized: return "unauthorized";
        case FailureKind::HttpStatus: return "http-status";
        case FailureKind::MalformedBody: return "malformed-body";
    }
    return "unknown";
}

nlohmann::json leaderboard_request(const std::string& statistic_name,
                                   int start_position, int max_results) {
    return {
        {"StatisticName", statistic_name},
        {"StartPosition", start_position},
        {"MaxResultsCount", max_results},
        {"ProfileConstraints", profile_constraints()},
    };
}

nlohmann::json around_player_request(const std::string& statistic_name,
                                     const std::string& playfab_id, int max_results) {
    return {
        {"StatisticName", statistic_name},
        {"PlayFabId", playfab_id},
        {"MaxResultsCount", max_results},
        {"ProfileConstraints", profile_constraints()},
        {"Version", nullptr},
    };
}

LeaderboardEntry parse_entry(const nlohmann::json& j) {
    LeaderboardEntry entry;
    entry.playfab_id = j.at("PlayFabId").get<std::string>();
    entry.position = j.at("Position").get<int>();
    entry.stat_value = j.at("StatValue").get<int64_t>();
    entry.display_name = optional_str(j, "DisplayName");

    if (j.contains("Profile") && j["Profile"].is_object()) {
        auto& profile = j["Profile"];
        entry.profile_display_name = optional_str(profile, "DisplayName");

        if (profile.contains("LinkedAccounts") && profile["LinkedAccounts"].is_array()) {
            for (auto& account : profile["LinkedAccounts"]) {
                if (!account.is_object()) continue;
                entry.linked_accounts.push_back({
                    .platform = safe_str(account, "Platform"),
                    .platform_user_id = safe_str(account, "PlatformUserId"),
                });
            }
        }
    }
    return entry;
}

PageResult interpret_response(int status, const std::string& body) {
    if (status == 401) {
        return std::unexpected(FetchFailure{
            FailureKind::Unauthorized, status,
            "Authentication failed - session token may be expired"});
    }
    if (status != 200) {
        return std::unexpected(FetchFailure{
            FailureKind::HttpStatus, status, "HTTP " + std::to_string(status)});
    }

    try {
        auto json = nlohmann::json::parse(body);
        if (!json.contains("data") || !json["data"].is_object() ||
            !json["data"].contains("Leaderboard") || !json["data"]["Leaderboard"].is_array()) {
            return std::unexpected(FetchFailure{
                FailureKind::MalformedBody, status, "Response has no data.Leaderboard array"});
        }

        auto& data = json["data"];
        LeaderboardPage page;
        for (auto& item : data["Leaderboard"]) {
            page.entries.push_back(parse_entry(item));
        }
        if (data.contains("Version") && data["Version"].is_number_integer()) {
            page.version = data["Version"].get<int64_t>();
        }
        return page;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(FetchFailure{
            FailureKind::MalformedBody, status, std::string("JSON parse error: ") + e.what()});
    }
}

PlayFabClient::PlayFabClient(PlayFabConfig config) : config_(std::move(config)) {
    if (!config_.execute_requests) {
        LOG_WARN("PlayFab client in DRY-RUN mode - no HTTP requests will be executed");
    }
}

PageResult PlayFabClient::fetch_page(const std::string& statistic_name,
                                     int start_position, int max_results) {
    return post("/Client/GetLeaderboard",
                leaderboard_request(statistic_name, start_position, max_results));
}

PageResult PlayFabClient::fetch_around_player(const std::string& statistic_name,
                                              const std::string& playfab_id,
                                              int max_results) {
    return post("/Client/GetLeaderboardAroundPlayer",
                around_player_request(statistic_name, playfab_id, max_results));
}

PageResult PlayFabClient::post(const std::string& endpoint, const nlohmann::json& payload) {
    LOG_INFO("API request intent: {}{} payload={} execute={}",
             config_.base_url, endpoint, payload.dump(), config_.execute_requests);

    if (!config_.execute_requests) {
        LOG_WARN("DRY-RUN: request not executed ({})", endpoint);
        return LeaderboardPage{.entries = {}, .version = 0, .dry_run = true};
    }

    if (config_.session_token.empty()) {
        LOG_ERROR("Session token is empty - cannot make request");
        return std::unexpected(FetchFailure{
            FailureKind::MissingCredential, 0, "Session token is empty"});
    }

    httplib::Client client(config_.base_url);
    client.set_connection_timeout(config_.connect_timeout_secs);
    client.set_read_timeout(config_.read_timeout_secs);

    httplib::Headers headers{
        {"X-Authorization", config_.session_token},
    };

    auto res = client.Post(endpoint, headers, payload.dump(), "application/json");
    if (!res) {
        auto msg = "Connection failed: " + httplib::to_string(res.error());
        LOG_ERROR("{} ({})", msg, endpoint);
        return std::unexpected(FetchFailure{FailureKind::Transport, 0, msg});
    }

    LOG_INFO("API response received: HTTP {}", res->status);

    auto result = interpret_response(res->status, res->body);
    if (!result) {
        auto& failure = result.error();
        if (failure.kind == FailureKind::Unauthorized) {
            LOG_ERROR("Authentication failed - session token may be expired");
        } else {
            LOG_ERROR("API request failed [{}]: {} body={}",
                      failure_kind_name(failure.kind), failure.message, res->body);
        }
    }
    return result;
}

} // namespace fits
