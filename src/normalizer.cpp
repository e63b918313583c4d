#include "fits/normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace fits {

namespace {

constexpr std::string_view gog_marker = "[GOG]";

std::string trim(std::string_view sv) {
    constexpr std::string_view ws{" \t\r\n\v\f\0", 7}; // includes NUL
    auto start = sv.find_first_not_of(ws);
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(ws);
    return std::string(sv.substr(start, end - start + 1));
}

std::string upper(std::string_view sv) {
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool contains_gog_marker(std::string_view user_id) {
    return upper(user_id).find(gog_marker) != std::string::npos;
}

// Removes every case-insensitive "[GOG]" and trims what is left.
std::string strip_gog_marker(std::string_view user_id) {
    std::string out(user_id);
    for (;;) {
        auto pos = upper(out).find(gog_marker);
        if (pos == std::string::npos) break;
        out.erase(pos, gog_marker.size());
    }
    return trim(out);
}

// UTF-8 never uses bytes below 0x80 inside multi-byte sequences, so the
// controls can be dropped byte-wise.
std::string strip_controls(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        auto b = static_cast<unsigned char>(c);
        if (b < 0x20 || b == 0x7F) continue;
        out.push_back(c);
    }
    return out;
}

std::string nfkc(const std::string& s) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || normalizer == nullptr) return s;

    auto source = icu::UnicodeString::fromUTF8(s);
    auto normalized = normalizer->normalize(source, status);
    if (U_FAILURE(status)) return s;

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace

std::optional<std::string> sanitize_string(const std::optional<std::string>& raw) {
    if (!raw) return std::nullopt;
    auto s = trim(*raw);
    s = strip_controls(s);
    s = trim(nfkc(s));
    return non_empty(s);
}

PlayerIdentity normalize_identity(const LeaderboardEntry& entry) {
    PlayerIdentity identity;
    auto& accounts = entry.linked_accounts;
    bool resolved = false;

    for (auto& account : accounts) {
        if (upper(account.platform) == "GOG") {
            identity.platform = "GOG";
            identity.platform_user_id = non_empty(account.platform_user_id);
            resolved = true;
            break;
        }
        // Some entries come back as Platform=Custom with a "[GOG]..." user id.
        if (contains_gog_marker(account.platform_user_id)) {
            identity.platform = "GOG";
            identity.platform_user_id = strip_gog_marker(account.platform_user_id);
            resolved = true;
            break;
        }
    }

    if (!resolved && !accounts.empty()) {
        auto& first = accounts.front();
        if (contains_gog_marker(first.platform_user_id)) {
            identity.platform = "GOG";
            identity.platform_user_id = strip_gog_marker(first.platform_user_id);
        } else {
            identity.platform = non_empty(first.platform);
            identity.platform_user_id = non_empty(first.platform_user_id);
        }
    }

    identity.display_name = sanitize_string(
        entry.display_name ? entry.display_name : entry.profile_display_name);
    identity.platform_user_id = sanitize_string(identity.platform_user_id);
    return identity;
}

Player normalize_player(const LeaderboardEntry& entry, Date seen_on) {
    auto identity = normalize_identity(entry);
    return {
        .playfab_id = entry.playfab_id,
        .display_name = std::move(identity.display_name),
        .platform = std::move(identity.platform),
        .platform_user_id = std::move(identity.platform_user_id),
        .first_seen = seen_on,
        .last_seen = seen_on,
    };
}

DailyScore normalize_score(const LeaderboardEntry& entry,
                           const std::string& statistic_name, Date stat_date) {
    return {
        .stat_date = stat_date,
        .statistic_name = statistic_name,
        .playfab_id = entry.playfab_id,
        .position = entry.position,
        .score = entry.stat_value,
    };
}

} // namespace fits
