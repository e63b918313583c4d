#include <gtest/gtest.h>
#include "fits/normalizer.hpp"

namespace {

using namespace std::chrono;

fits::LeaderboardEntry make_entry(std::vector<fits::LinkedAccount> accounts) {
    fits::LeaderboardEntry e;
    e.playfab_id = "ABC123";
    e.linked_accounts = std::move(accounts);
    e.position = 4;
    e.stat_value = 1200;
    return e;
}

} // namespace

TEST(SanitizeString, StripsControlsAndWhitespace) {
    std::string raw("  Bad\x07Name\x00 ", 12);
    EXPECT_EQ(fits::sanitize_string(raw), "BadName");
}

TEST(SanitizeString, EmptyBecomesNullopt) {
    EXPECT_FALSE(fits::sanitize_string(std::string("   ")).has_value());
    EXPECT_FALSE(fits::sanitize_string(std::string("\x01\x02")).has_value());
    EXPECT_FALSE(fits::sanitize_string(std::nullopt).has_value());
}

TEST(SanitizeString, AppliesNfkc) {
    // Fullwidth "ＡＢＣ" and the "ﬁ" ligature fold to ASCII.
    EXPECT_EQ(fits::sanitize_string(std::string("\xEF\xBC\xA1\xEF\xBC\xA2\xEF\xBC\xA3")), "ABC");
    EXPECT_EQ(fits::sanitize_string(std::string("\xEF\xAC\x81sh")), "fish");
}

TEST(SanitizeString, KeepsMultibyteText) {
    EXPECT_EQ(fits::sanitize_string(std::string("Caf\xC3\xA9")), "Caf\xC3\xA9");
}

TEST(NormalizeIdentity, GogMarkerWinsOverSteam) {
    auto e = make_entry({{"Custom", "[GOG] 42"}, {"Steam", "S1"}});
    auto id = fits::normalize_identity(e);
    EXPECT_EQ(id.platform, "GOG");
    EXPECT_EQ(id.platform_user_id, "42");
}

TEST(NormalizeIdentity, GogPlatformTagIsCaseInsensitive) {
    auto e = make_entry({{"Steam", "S1"}, {"gog", "777"}});
    auto id = fits::normalize_identity(e);
    EXPECT_EQ(id.platform, "GOG");
    EXPECT_EQ(id.platform_user_id, "777");
}

TEST(NormalizeIdentity, MarkerIsStrippedCaseInsensitively) {
    auto e = make_entry({{"Custom", "  [gog]Player One "}});
    auto id = fits::normalize_identity(e);
    EXPECT_EQ(id.platform, "GOG");
    EXPECT_EQ(id.platform_user_id, "Player One");
}

TEST(NormalizeIdentity, FallsBackToFirstAccount) {
    auto e = make_entry({{"Steam", "S1"}, {"Xbox", "X1"}});
    auto id = fits::normalize_identity(e);
    EXPECT_EQ(id.platform, "Steam");
    EXPECT_EQ(id.platform_user_id, "S1");
}

TEST(NormalizeIdentity, NoAccountsMeansNoPlatform) {
    auto id = fits::normalize_identity(make_entry({}));
    EXPECT_FALSE(id.platform.has_value());
    EXPECT_FALSE(id.platform_user_id.has_value());
}

TEST(NormalizeIdentity, EmptyGogUserIdIsNull) {
    auto id = fits::normalize_identity(make_entry({{"GOG", ""}}));
    EXPECT_EQ(id.platform, "GOG");
    EXPECT_FALSE(id.platform_user_id.has_value());
}

TEST(NormalizeIdentity, DisplayNamePrecedence) {
    auto e = make_entry({});
    e.display_name = "Entry";
    e.profile_display_name = "Profile";
    EXPECT_EQ(fits::normalize_identity(e).display_name, "Entry");

    e.display_name.reset();
    EXPECT_EQ(fits::normalize_identity(e).display_name, "Profile");

    e.profile_display_name.reset();
    EXPECT_FALSE(fits::normalize_identity(e).display_name.has_value());
}

TEST(NormalizeScore, CopiesUpstreamValues) {
    auto date = fits::Date{year{2026}, month{1}, day{22}};
    auto score = fits::normalize_score(make_entry({}), "DailyPlay_Thurs", date);
    EXPECT_EQ(score.playfab_id, "ABC123");
    EXPECT_EQ(score.position, 4);
    EXPECT_EQ(score.score, 1200);
    EXPECT_EQ(score.statistic_name, "DailyPlay_Thurs");
    EXPECT_EQ(score.stat_date, date);
}

TEST(NormalizePlayer, SeenOnSetsBothDates) {
    auto date = fits::Date{year{2026}, month{1}, day{22}};
    auto player = fits::normalize_player(make_entry({{"Steam", "S1"}}), date);
    EXPECT_EQ(player.playfab_id, "ABC123");
    EXPECT_EQ(player.first_seen, date);
    EXPECT_EQ(player.last_seen, date);
    EXPECT_EQ(player.platform, "Steam");
}
