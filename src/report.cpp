#include "fits/report.hpp"
#include "fits/calendar.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace fits {

namespace {

using namespace ftxui;

// -- Formatting helpers --

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string rank_str(int position) {
    return "#" + std::to_string(position + 1);
}

std::string opt_str(const std::optional<std::string>& s) {
    return s.value_or("-");
}

Color podium_color(int position) {
    if (position == 0) return Color::Gold1;
    if (position == 1) return Color::GrayLight;
    if (position == 2) return Color::Orange3;
    return Color::Default;
}

size_t visible_rows(size_t available, int limit) {
    if (limit <= 0) return available;
    return std::min(available, static_cast<size_t>(limit));
}

void decorate(Table& table, size_t row_count) {
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    for (size_t i = 1; i <= row_count && i <= 3; ++i) {
        table.SelectRow(static_cast<int>(i)).Decorate(color(podium_color(static_cast<int>(i - 1))));
    }
}

void print_element(const Element& document) {
    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    screen.Print();
    std::cout << "\n";
}

// -- Render functions --

Element render_daily(const std::vector<DailyLeaderboardRow>& data, Date stat_date,
                     const std::optional<RunAudit>& run, int limit) {
    auto title = text("Daily Leaderboard  " + format_date(stat_date)) | bold | color(Color::Cyan);
    if (data.empty()) return vbox({title, separator(), text("No scores stored for this date.") | dim});

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Rank", "Player", "Platform", "Score"});
    auto n = visible_rows(data.size(), limit);
    for (size_t i = 0; i < n; ++i) {
        auto& r = data[i];
        rows.push_back({
            rank_str(r.score.position), player_label(r.player),
            opt_str(r.player.platform), std::to_string(r.score.score),
        });
    }

    auto table = Table(rows);
    decorate(table, n);

    Elements meta;
    meta.push_back(text("Statistic: " + data.front().score.statistic_name) | dim);
    if (run) {
        meta.push_back(text("  |  Fetched: " + run->fetched_at) | dim);
        meta.push_back(text("  |  Entries: " + std::to_string(run->entry_count)) | dim);
    }

    return vbox({
        title,
        separator(),
        hbox(meta),
        table.Render(),
    });
}

Element render_period(const std::vector<PeriodLeaderboardRow>& data, const Period& period,
                      int limit) {
    auto heading = std::string(period.grain == PeriodGrain::Week ? "Weekly" : "Monthly") +
                   " Leaderboard  " + format_date(period.start) + " to " +
                   format_date(period.end);
    auto title = text(heading) | bold | color(Color::Cyan);
    if (data.empty()) {
        return vbox({title, separator(), text("No aggregate stored for this period.") | dim});
    }

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Rank", "Player", "Total", "Days", "Average", "Best", "Best Day"});
    auto n = visible_rows(data.size(), limit);
    for (size_t i = 0; i < n; ++i) {
        auto& a = data[i].aggregate;
        rows.push_back({
            rank_str(a.position), player_label(data[i].player),
            std::to_string(a.total_score),
            std::to_string(a.days_participated) + "/" + std::to_string(period.length_days()),
            f2(a.average_score), std::to_string(a.best_daily_score),
            format_date(a.best_daily_date),
        });
    }

    auto table = Table(rows);
    decorate(table, n);

    return vbox({
        title,
        separator(),
        text("Calculated: " + data.front().aggregate.calculated_at) | dim,
        table.Render(),
    });
}

Element render_all_time(const std::vector<AllTimeRow>& data, const AllTimeStats& stats,
                        int limit) {
    auto title = text("All-Time Leaderboard") | bold | color(Color::Cyan);
    if (data.empty()) return vbox({title, separator(), text("No scores stored yet.") | dim});

    auto stat_box = [](const std::string& label, const std::string& value) {
        return vbox({
            text(value) | bold | center,
            text(label) | dim | center,
        }) | size(WIDTH, EQUAL, 16) | borderLight;
    };

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Rank", "Player", "Total", "Days", "Average", "Best", "Worst", "Best Day"});
    auto n = visible_rows(data.size(), limit);
    for (size_t i = 0; i < n; ++i) {
        auto& r = data[i];
        rows.push_back({
            rank_str(r.position), player_label(r.player),
            std::to_string(r.total_score), std::to_string(r.days_played),
            f2(r.average_score), std::to_string(r.best_daily_score),
            std::to_string(r.worst_daily_score), format_date(r.best_day_date),
        });
    }

    auto table = Table(rows);
    decorate(table, n);

    return vbox({
        title,
        separator(),
        hbox({
            stat_box("Players", std::to_string(stats.total_players)),
            stat_box("Days", std::to_string(stats.total_days)),
            stat_box("Highest", std::to_string(stats.highest_score_ever)),
            stat_box("Avg Daily", f2(stats.average_daily_score)),
        }),
        table.Render(),
    });
}

} // namespace

std::string player_label(const Player& player) {
    return player.display_name.value_or(player.playfab_id);
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) return value;

    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_daily_csv(std::ostream& out, const std::vector<DailyLeaderboardRow>& rows) {
    out << "stat_date,statistic_name,position,playfab_id,display_name,platform,platform_user_id,score\n";
    for (auto& r : rows) {
        out << format_date(r.score.stat_date) << ','
            << csv_field(r.score.statistic_name) << ','
            << r.score.position << ','
            << csv_field(r.player.playfab_id) << ','
            << csv_field(r.player.display_name.value_or("")) << ','
            << csv_field(r.player.platform.value_or("")) << ','
            << csv_field(r.player.platform_user_id.value_or("")) << ','
            << r.score.score << '\n';
    }
}

void write_period_csv(std::ostream& out, const std::vector<PeriodLeaderboardRow>& rows) {
    out << "period_start,period_end,position,playfab_id,display_name,total_score,"
           "days_participated,average_score,best_daily_score,best_daily_date\n";
    for (auto& r : rows) {
        auto& a = r.aggregate;
        out << format_date(a.period_start) << ','
            << format_date(a.period_end) << ','
            << a.position << ','
            << csv_field(a.playfab_id) << ','
            << csv_field(r.player.display_name.value_or("")) << ','
            << a.total_score << ','
            << a.days_participated << ','
            << f2(a.average_score) << ','
            << a.best_daily_score << ','
            << format_date(a.best_daily_date) << '\n';
    }
}

void write_all_time_csv(std::ostream& out, const std::vector<AllTimeRow>& rows) {
    out << "position,playfab_id,display_name,days_played,total_score,average_score,"
           "best_daily_score,worst_daily_score,best_day_date\n";
    for (auto& r : rows) {
        out << r.position << ','
            << csv_field(r.player.playfab_id) << ','
            << csv_field(r.player.display_name.value_or("")) << ','
            << r.days_played << ','
            << r.total_score << ','
            << f2(r.average_score) << ','
            << r.best_daily_score << ','
            << r.worst_daily_score << ','
            << format_date(r.best_day_date) << '\n';
    }
}

void display_daily(const std::vector<DailyLeaderboardRow>& rows, Date stat_date,
                   const std::optional<RunAudit>& run, OutputFormat format, int limit) {
    if (format == OutputFormat::Csv) {
        write_daily_csv(std::cout, rows);
        return;
    }
    print_element(render_daily(rows, stat_date, run, limit));
}

void display_period(const std::vector<PeriodLeaderboardRow>& rows, const Period& period,
                    OutputFormat format, int limit) {
    if (format == OutputFormat::Csv) {
        write_period_csv(std::cout, rows);
        return;
    }
    print_element(render_period(rows, period, limit));
}

void display_all_time(const std::vector<AllTimeRow>& rows, const AllTimeStats& stats,
                      OutputFormat format, int limit) {
    if (format == OutputFormat::Csv) {
        write_all_time_csv(std::cout, rows);
        return;
    }
    print_element(render_all_time(rows, stats, limit));
}

} // namespace fits
