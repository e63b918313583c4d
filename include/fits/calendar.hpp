#pragma once

#include "fits/types.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace fits {

std::expected<Date, std::string> parse_date(std::string_view text);

// "YYYY-MM", resolved to the first day of the month.
std::expected<Date, std::string> parse_month(std::string_view text);

std::string format_date(Date d);

Date today_utc();

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string utc_timestamp();

// Upstream statistic for the given day, e.g. "DailyPlay_Thurs".
std::string statistic_name_for(Date d);

Period week_containing(Date d);
Period month_containing(Date d);
Period period_containing(PeriodGrain grain, Date d);

std::vector<Period> periods_covering(PeriodGrain grain, Date first, Date last);

std::vector<Date> dates_between(Date from, Date to);

std::string grain_name(PeriodGrain grain);

} // namespace fits
