#pragma once

#include "fits/config.hpp"
#include "fits/score_store.hpp"
#include "fits/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

namespace fits {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

nlohmann::json success_envelope(nlohmann::json data, nlohmann::json meta = nlohmann::json::object());
ApiResponse error_response(int status, const std::string& message);

nlohmann::json player_json(const Player& player);
nlohmann::json daily_row_json(const DailyLeaderboardRow& row);
nlohmann::json period_row_json(const PeriodLeaderboardRow& row);
nlohmann::json all_time_row_json(const AllTimeRow& row);

// Endpoint bodies. Absent parameters fall back to `today`.
ApiResponse daily_endpoint(const ScoreStore& store, const std::optional<std::string>& date,
                           Date today);
ApiResponse weekly_endpoint(const ScoreStore& store, const std::optional<std::string>& week,
                            bool list, Date today);
ApiResponse monthly_endpoint(const ScoreStore& store, const std::optional<std::string>& month,
                             bool list, Date today);
ApiResponse all_time_endpoint(const ScoreStore& store);

// Read-only JSON endpoints over the stored leaderboards. Each request opens
// its own store handle.
class ApiServer {
public:
    explicit ApiServer(AppConfig config);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    bool listen(const std::string& host, int port);
    void stop();

private:
    AppConfig config_;
    std::unique_ptr<httplib::Server> server_;

    void register_routes();
};

} // namespace fits
