#pragma once

#include "fits/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace fits {

// Trims, strips C0 controls and DEL, applies NFKC. Empty results become nullopt.
std::optional<std::string> sanitize_string(const std::optional<std::string>& raw);

PlayerIdentity normalize_identity(const LeaderboardEntry& entry);

Player normalize_player(const LeaderboardEntry& entry, Date seen_on);

DailyScore normalize_score(const LeaderboardEntry& entry,
                           const std::string& statistic_name, Date stat_date);

} // namespace fits
