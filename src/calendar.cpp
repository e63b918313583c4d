#include "fits/calendar.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <format>

namespace fits {

namespace {

using namespace std::chrono;

// Monday..Sunday as the upstream names them ("Tues" and "Thurs", not "Tue"/"Thu").
constexpr std::array<std::string_view, 7> day_tokens = {
    "Mon", "Tues", "Wed", "Thurs", "Fri", "Sat", "Sun",
};

bool all_digits(std::string_view sv) {
    if (sv.empty()) return false;
    for (char c : sv) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int to_int(std::string_view sv) {
    int value = 0;
    std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return value;
}

} // namespace

std::expected<Date, std::string> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !all_digits(text.substr(0, 4)) || !all_digits(text.substr(5, 2)) ||
        !all_digits(text.substr(8, 2))) {
        return std::unexpected("Invalid date format. Use YYYY-MM-DD.");
    }

    Date d{year{to_int(text.substr(0, 4))},
           month{static_cast<unsigned>(to_int(text.substr(5, 2)))},
           day{static_cast<unsigned>(to_int(text.substr(8, 2)))}};
    if (!d.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(text));
    }
    return d;
}

std::expected<Date, std::string> parse_month(std::string_view text) {
    if (text.size() != 7 || text[4] != '-' ||
        !all_digits(text.substr(0, 4)) || !all_digits(text.substr(5, 2))) {
        return std::unexpected("Invalid month format. Use YYYY-MM.");
    }

    Date d{year{to_int(text.substr(0, 4))},
           month{static_cast<unsigned>(to_int(text.substr(5, 2)))},
           day{1}};
    if (!d.ok()) {
        return std::unexpected("Invalid month: " + std::string(text));
    }
    return d;
}

std::string format_date(Date d) {
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(d.year()),
                       static_cast<unsigned>(d.month()),
                       static_cast<unsigned>(d.day()));
}

Date today_utc() {
    return Date{floor<days>(system_clock::now())};
}

std::string utc_timestamp() {
    return std::format("{:%Y-%m-%d %H:%M:%S}", floor<seconds>(system_clock::now()));
}

std::string statistic_name_for(Date d) {
    weekday wd{sys_days{d}};
    return "DailyPlay_" + std::string(day_tokens[wd.iso_encoding() - 1]);
}

Period week_containing(Date d) {
    sys_days sd{d};
    weekday wd{sd};
    auto start = sd - days{wd.c_encoding()}; // c_encoding: Sunday == 0
    return {
        .grain = PeriodGrain::Week,
        .start = Date{start},
        .end = Date{start + days{6}},
    };
}

Period month_containing(Date d) {
    return {
        .grain = PeriodGrain::Month,
        .start = d.year() / d.month() / day{1},
        .end = Date{d.year() / d.month() / last},
    };
}

Period period_containing(PeriodGrain grain, Date d) {
    return grain == PeriodGrain::Week ? week_containing(d) : month_containing(d);
}

std::vector<Period> periods_covering(PeriodGrain grain, Date first, Date last) {
    std::vector<Period> periods;
    if (sys_days{first} > sys_days{last}) return periods;

    auto period = period_containing(grain, first);
    while (sys_days{period.start} <= sys_days{last}) {
        periods.push_back(period);
        period = period_containing(grain, Date{sys_days{period.end} + days{1}});
    }
    return periods;
}

std::vector<Date> dates_between(Date from, Date to) {
    std::vector<Date> dates;
    for (auto d = sys_days{from}; d <= sys_days{to}; d += days{1}) {
        dates.emplace_back(d);
    }
    return dates;
}

std::string grain_name(PeriodGrain grain) {
    return grain == PeriodGrain::Week ? "week" : "month";
}

} // namespace fits
