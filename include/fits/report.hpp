#pragma once

#include "fits/types.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fits {

enum class OutputFormat { Table, Csv };

void display_daily(const std::vector<DailyLeaderboardRow>& rows, Date stat_date,
                   const std::optional<RunAudit>& run, OutputFormat format, int limit);

void display_period(const std::vector<PeriodLeaderboardRow>& rows, const Period& period,
                    OutputFormat format, int limit);

void display_all_time(const std::vector<AllTimeRow>& rows, const AllTimeStats& stats,
                      OutputFormat format, int limit);

void write_daily_csv(std::ostream& out, const std::vector<DailyLeaderboardRow>& rows);
void write_period_csv(std::ostream& out, const std::vector<PeriodLeaderboardRow>& rows);
void write_all_time_csv(std::ostream& out, const std::vector<AllTimeRow>& rows);

// Quotes a CSV field when it holds a comma, quote or newline.
std::string csv_field(const std::string& value);

std::string player_label(const Player& player);

} // namespace fits
