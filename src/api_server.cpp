#include "fits/api_server.hpp"
#include "fits/calendar.hpp"
#include "fits/logging.hpp"
#include <cmath>
#include <functional>
#include <httplib.h>

namespace fits {

namespace {

nlohmann::json nullable(const std::optional<std::string>& s) {
    if (!s) return nullptr;
    return *s;
}

nlohmann::json nullable(const std::optional<Date>& d) {
    if (!d) return nullptr;
    return format_date(*d);
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::optional<std::string> param(const httplib::Request& req, const std::string& key) {
    if (!req.has_param(key)) return std::nullopt;
    return req.get_param_value(key);
}

ApiResponse store_failure(const StoreError& error) {
    LOG_ERROR("API query failed: {}", error.message);
    return error_response(500, "Database error: " + error.message);
}

nlohmann::json listing_json(const PeriodListing& listing, PeriodGrain grain) {
    auto prefix = grain == PeriodGrain::Week ? std::string("week") : std::string("month");
    return {
        {prefix + "_start", format_date(listing.period_start)},
        {prefix + "_end", format_date(listing.period_end)},
        {"player_count", listing.player_count},
        {"top_score", listing.top_score},
    };
}

ApiResponse period_endpoint(const ScoreStore& store, PeriodGrain grain, Date anchor,
                            const std::string& requested, bool list) {
    if (list) {
        auto listings = store.list_periods(grain);
        if (!listings) return store_failure(listings.error());

        auto data = nlohmann::json::array();
        for (auto& l : *listings) data.push_back(listing_json(l, grain));
        return {200, success_envelope(std::move(data), {{"count", listings->size()}})};
    }

    auto period = period_containing(grain, anchor);
    auto rows = store.period_leaderboard(period);
    if (!rows) return store_failure(rows.error());

    auto data = nlohmann::json::array();
    for (auto& r : *rows) data.push_back(period_row_json(r));

    nlohmann::json meta;
    if (grain == PeriodGrain::Week) {
        meta = {
            {"week_start", format_date(period.start)},
            {"week_end", format_date(period.end)},
            {"count", rows->size()},
            {"requested_date", requested},
        };
    } else {
        meta = {
            {"month_start", format_date(period.start)},
            {"month_end", format_date(period.end)},
            {"days_in_month", period.length_days()},
            {"count", rows->size()},
            {"requested_month", requested},
        };
    }
    return {200, success_envelope(std::move(data), std::move(meta))};
}

} // namespace

nlohmann::json success_envelope(nlohmann::json data, nlohmann::json meta) {
    nlohmann::json envelope;
    envelope["success"] = true;
    envelope["data"] = std::move(data);
    envelope["meta"] = std::move(meta);
    return envelope;
}

ApiResponse error_response(int status, const std::string& message) {
    nlohmann::json envelope;
    envelope["success"] = false;
    envelope["error"] = message;
    return {status, std::move(envelope)};
}

nlohmann::json player_json(const Player& player) {
    return {
        {"playfab_id", player.playfab_id},
        {"display_name", nullable(player.display_name)},
        {"platform", nullable(player.platform)},
        {"platform_user_id", nullable(player.platform_user_id)},
        {"first_seen", format_date(player.first_seen)},
        {"last_seen", format_date(player.last_seen)},
    };
}

nlohmann::json daily_row_json(const DailyLeaderboardRow& row) {
    auto j = player_json(row.player);
    j["stat_date"] = format_date(row.score.stat_date);
    j["statistic_name"] = row.score.statistic_name;
    j["position"] = row.score.position;
    j["score"] = row.score.score;
    return j;
}

nlohmann::json period_row_json(const PeriodLeaderboardRow& row) {
    auto& a = row.aggregate;
    return {
        {"period_start", format_date(a.period_start)},
        {"period_end", format_date(a.period_end)},
        {"position", a.position},
        {"total_score", a.total_score},
        {"days_participated", a.days_participated},
        {"average_score", a.average_score},
        {"best_daily_score", a.best_daily_score},
        {"best_daily_date", format_date(a.best_daily_date)},
        {"calculated_at", a.calculated_at},
        {"playfab_id", row.player.playfab_id},
        {"display_name", nullable(row.player.display_name)},
        {"platform", nullable(row.player.platform)},
        {"platform_user_id", nullable(row.player.platform_user_id)},
    };
}

nlohmann::json all_time_row_json(const AllTimeRow& row) {
    auto j = player_json(row.player);
    j["position"] = row.position;
    j["total_days_played"] = row.days_played;
    j["total_score"] = row.total_score;
    j["average_score"] = round2(row.average_score);
    j["best_daily_score"] = row.best_daily_score;
    j["worst_daily_score"] = row.worst_daily_score;
    j["best_day_date"] = format_date(row.best_day_date);
    return j;
}

ApiResponse daily_endpoint(const ScoreStore& store, const std::optional<std::string>& date,
                           Date today) {
    auto requested = date.value_or(format_date(today));
    auto stat_date = parse_date(requested);
    if (!stat_date) return error_response(400, stat_date.error());

    auto rows = store.daily_leaderboard(*stat_date);
    if (!rows) return store_failure(rows.error());
    auto run = store.latest_run(*stat_date);
    if (!run) return store_failure(run.error());

    auto data = nlohmann::json::array();
    for (auto& r : *rows) data.push_back(daily_row_json(r));

    nlohmann::json meta = {
        {"date", format_date(*stat_date)},
        {"count", rows->size()},
        {"statistic_name", *run ? nlohmann::json((*run)->statistic_name) : nlohmann::json()},
        {"fetched_at", *run ? nlohmann::json((*run)->fetched_at) : nlohmann::json()},
        {"last_updated", *run ? nlohmann::json((*run)->fetched_at) : nlohmann::json()},
    };
    return {200, success_envelope(std::move(data), std::move(meta))};
}

ApiResponse weekly_endpoint(const ScoreStore& store, const std::optional<std::string>& week,
                            bool list, Date today) {
    auto requested = week.value_or(format_date(today));
    Date anchor = today;
    if (!list) {
        auto parsed = parse_date(requested);
        if (!parsed) return error_response(400, parsed.error());
        anchor = *parsed;
    }
    return period_endpoint(store, PeriodGrain::Week, anchor, requested, list);
}

ApiResponse monthly_endpoint(const ScoreStore& store, const std::optional<std::string>& month,
                             bool list, Date today) {
    auto requested = month.value_or(format_date(today).substr(0, 7));
    Date anchor = today;
    if (!list) {
        auto parsed = parse_month(requested);
        if (!parsed) return error_response(400, parsed.error());
        anchor = *parsed;
    }
    return period_endpoint(store, PeriodGrain::Month, anchor, requested, list);
}

ApiResponse all_time_endpoint(const ScoreStore& store) {
    auto rows = store.all_time_leaderboard();
    if (!rows) return store_failure(rows.error());
    auto stats = store.all_time_stats();
    if (!stats) return store_failure(stats.error());

    auto data = nlohmann::json::array();
    for (auto& r : *rows) data.push_back(all_time_row_json(r));

    int range_days = 0;
    if (stats->first_date && stats->last_date) {
        range_days = static_cast<int>((std::chrono::sys_days{*stats->last_date} -
                                       std::chrono::sys_days{*stats->first_date}).count()) + 1;
    }

    nlohmann::json meta = {
        {"total_players", stats->total_players},
        {"total_days_with_data", stats->total_days},
        {"date_range_days", range_days},
        {"first_date", nullable(stats->first_date)},
        {"last_date", nullable(stats->last_date)},
        {"cumulative_score", stats->cumulative_score},
        {"average_daily_score", round2(stats->average_daily_score)},
        {"highest_score_ever", stats->highest_score_ever},
        {"count", rows->size()},
        {"generated_at", utc_timestamp()},
    };
    return {200, success_envelope(std::move(data), std::move(meta))};
}

ApiServer::ApiServer(AppConfig config)
    : config_(std::move(config)), server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

ApiServer::~ApiServer() = default;

bool ApiServer::listen(const std::string& host, int port) {
    LOG_INFO("Read API listening on {}:{} (database {})", host, port, config_.db_path.string());
    return server_->listen(host, port);
}

void ApiServer::stop() {
    server_->stop();
}

void ApiServer::register_routes() {
    auto with_store = [this](httplib::Response& res,
                             const std::function<ApiResponse(const ScoreStore&)>& handler) {
        ApiResponse response;
        try {
            ScoreStore store(config_.db_path, true);
            response = handler(store);
        } catch (const StoreException& e) {
            LOG_ERROR("API could not open database: {}", e.what());
            response = error_response(500, e.what());
        }
        res.status = response.status;
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET");
        res.set_content(response.body.dump(4), "application/json");
    };

    server_->Get("/api/leaderboard", [with_store](const httplib::Request& req, httplib::Response& res) {
        with_store(res, [&](const ScoreStore& store) {
            return daily_endpoint(store, param(req, "date"), today_utc());
        });
    });

    server_->Get("/api/weekly", [with_store](const httplib::Request& req, httplib::Response& res) {
        with_store(res, [&](const ScoreStore& store) {
            return weekly_endpoint(store, param(req, "week"), req.has_param("list"), today_utc());
        });
    });

    server_->Get("/api/monthly", [with_store](const httplib::Request& req, httplib::Response& res) {
        with_store(res, [&](const ScoreStore& store) {
            return monthly_endpoint(store, param(req, "month"), req.has_param("list"), today_utc());
        });
    });

    server_->Get("/api/alltime", [with_store](const httplib::Request&, httplib::Response& res) {
        with_store(res, [](const ScoreStore& store) { return all_time_endpoint(store); });
    });
}

} // namespace fits
