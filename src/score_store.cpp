#include "fits/score_store.hpp"
#include "fits/calendar.hpp"
#include "fits/logging.hpp"
#include <sqlite3.h>

namespace fits {

namespace {

constexpr const char* schema_sql = R"sql(
CREATE TABLE IF NOT EXISTS players (
  playfab_id TEXT PRIMARY KEY,
  display_name TEXT,
  platform TEXT,
  platform_user_id TEXT,
  first_seen DATE,
  last_seen DATE
);
CREATE INDEX IF NOT EXISTS idx_players_display_name ON players(display_name);

CREATE TABLE IF NOT EXISTS daily_scores (
  stat_date DATE NOT NULL,
  statistic_name TEXT NOT NULL,
  position INTEGER NOT NULL,
  playfab_id TEXT NOT NULL,
  score INTEGER NOT NULL,
  PRIMARY KEY (stat_date, playfab_id),
  FOREIGN KEY (playfab_id) REFERENCES players(playfab_id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_daily_scores_date ON daily_scores(stat_date);
CREATE INDEX IF NOT EXISTS idx_daily_scores_position ON daily_scores(position);

CREATE TABLE IF NOT EXISTS runs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  stat_date DATE NOT NULL,
  statistic_name TEXT NOT NULL,
  fetched_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
  entry_count INTEGER,
  api_version TEXT
);
CREATE INDEX IF NOT EXISTS idx_runs_date ON runs(stat_date);

CREATE TABLE IF NOT EXISTS weekly_leaderboards (
  week_start DATE NOT NULL,
  week_end DATE NOT NULL,
  playfab_id TEXT NOT NULL,
  total_score INTEGER NOT NULL,
  days_participated INTEGER NOT NULL,
  average_score REAL NOT NULL,
  best_daily_score INTEGER,
  best_daily_date DATE,
  position INTEGER,
  calculated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
  PRIMARY KEY (week_start, playfab_id),
  FOREIGN KEY (playfab_id) REFERENCES players(playfab_id)
);
CREATE INDEX IF NOT EXISTS idx_weekly_leaderboards_week ON weekly_leaderboards(week_start, week_end);
CREATE INDEX IF NOT EXISTS idx_weekly_leaderboards_player ON weekly_leaderboards(playfab_id);
CREATE INDEX IF NOT EXISTS idx_weekly_leaderboards_score ON weekly_leaderboards(week_start, total_score DESC);

CREATE TABLE IF NOT EXISTS monthly_leaderboards (
  month_start DATE NOT NULL,
  month_end DATE NOT NULL,
  playfab_id TEXT NOT NULL,
  position INTEGER,
  total_score INTEGER NOT NULL,
  days_participated INTEGER NOT NULL,
  average_score REAL NOT NULL,
  best_daily_score INTEGER,
  best_daily_date DATE,
  calculated_at TIMESTAMP,
  PRIMARY KEY (month_start, playfab_id),
  FOREIGN KEY (playfab_id) REFERENCES players(playfab_id)
);
CREATE INDEX IF NOT EXISTS idx_monthly_position ON monthly_leaderboards(month_start, position);
CREATE INDEX IF NOT EXISTS idx_monthly_score ON monthly_leaderboards(month_start, total_score DESC);
)sql";

struct PeriodTable {
    std::string table;
    std::string start_col;
    std::string end_col;
};

PeriodTable table_for(PeriodGrain grain) {
    if (grain == PeriodGrain::Week) {
        return {"weekly_leaderboards", "week_start", "week_end"};
    }
    return {"monthly_leaderboards", "month_start", "month_end"};
}

// Prepared statement that finalizes itself. The first failed bind is
// remembered and reported by step().
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }

    // Ready for another execution with fresh bindings.
    void reset() {
        if (!stmt_) return;
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    Statement& bind(int idx, const std::string& value) {
        return check(sqlite3_bind_text(stmt_, idx, value.c_str(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }
    Statement& bind(int idx, const std::optional<std::string>& value) {
        if (!value) return check(sqlite3_bind_null(stmt_, idx));
        return bind(idx, *value);
    }
    Statement& bind(int idx, int64_t value) {
        return check(sqlite3_bind_int64(stmt_, idx, value));
    }
    Statement& bind(int idx, int value) {
        return check(sqlite3_bind_int(stmt_, idx, value));
    }
    Statement& bind(int idx, double value) {
        return check(sqlite3_bind_double(stmt_, idx, value));
    }
    Statement& bind(int idx, Date value) {
        return bind(idx, format_date(value));
    }

    int step() {
        if (rc_ != SQLITE_OK) return rc_;
        return sqlite3_step(stmt_);
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string text(int col) const {
        auto* p = sqlite3_column_text(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
    }
    std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) return std::nullopt;
        return text(col);
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    Date date(int col) const { return parse_date(text(col)).value_or(Date{}); }
    std::optional<Date> optional_date(int col) const {
        if (is_null(col)) return std::nullopt;
        auto parsed = parse_date(text(col));
        if (!parsed) return std::nullopt;
        return *parsed;
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;

    Statement& check(int rc) {
        if (rc_ == SQLITE_OK && rc != SQLITE_OK) rc_ = rc;
        return *this;
    }
};

// Columns: playfab_id, display_name, platform, platform_user_id, first_seen, last_seen
Player read_player(const Statement& stmt, int offset) {
    return {
        .playfab_id = stmt.text(offset),
        .display_name = stmt.optional_text(offset + 1),
        .platform = stmt.optional_text(offset + 2),
        .platform_user_id = stmt.optional_text(offset + 3),
        .first_seen = stmt.date(offset + 4),
        .last_seen = stmt.date(offset + 5),
    };
}

// Columns: start, end, playfab_id, total, days, avg, best, best_date, position, calculated_at
PeriodAggregate read_aggregate(const Statement& stmt, int offset) {
    return {
        .period_start = stmt.date(offset),
        .period_end = stmt.date(offset + 1),
        .playfab_id = stmt.text(offset + 2),
        .total_score = stmt.int64(offset + 3),
        .days_participated = stmt.integer(offset + 4),
        .average_score = stmt.real(offset + 5),
        .best_daily_score = stmt.int64(offset + 6),
        .best_daily_date = stmt.date(offset + 7),
        .position = stmt.integer(offset + 8),
        .calculated_at = stmt.text(offset + 9),
    };
}

RunAudit read_run(const Statement& stmt) {
    return {
        .id = stmt.int64(0),
        .stat_date = stmt.date(1),
        .statistic_name = stmt.text(2),
        .fetched_at = stmt.text(3),
        .entry_count = stmt.integer(4),
        .api_version = stmt.text(5),
    };
}

std::string aggregate_columns(const PeriodTable& t, const std::string& alias) {
    auto p = alias.empty() ? std::string() : alias + ".";
    return p + t.start_col + ", " + p + t.end_col + ", " + p + "playfab_id, " +
           p + "total_score, " + p + "days_participated, " + p + "average_score, " +
           p + "best_daily_score, " + p + "best_daily_date, " + p + "position, " +
           p + "calculated_at";
}

} // namespace

ScoreStore::ScoreStore(const std::filesystem::path& path, bool read_only) {
    int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = "Cannot open database " + path.string() + ": " +
                          (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreException(msg, rc);
    }
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("Connected to SQLite database {}", path.string());
}

ScoreStore::~ScoreStore() {
    sqlite3_close(db_);
}

StoreError ScoreStore::last_error(const std::string& context) const {
    return {sqlite3_extended_errcode(db_), context + ": " + sqlite3_errmsg(db_)};
}

StoreResult<void> ScoreStore::execute(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        StoreError error{sqlite3_extended_errcode(db_), err ? err : "sqlite3_exec failed"};
        sqlite3_free(err);
        return std::unexpected(error);
    }
    return {};
}

StoreResult<void> ScoreStore::with_transaction(const std::function<StoreResult<void>()>& work) {
    if (auto begun = execute("BEGIN IMMEDIATE"); !begun) return begun;

    auto result = work();
    if (result) {
        result = execute("COMMIT");
        if (result) return result;
    }

    if (auto rolled_back = execute("ROLLBACK"); !rolled_back) {
        LOG_ERROR("Rollback failed: {}", rolled_back.error().message);
    }
    return result;
}

StoreResult<void> ScoreStore::initialize_schema() {
    auto result = execute(schema_sql);
    if (result) {
        LOG_INFO("Database schema ready");
    } else {
        LOG_ERROR("Schema initialization failed: {}", result.error().message);
    }
    return result;
}

bool ScoreStore::upsert_player(const Player& player) {
    Statement stmt(db_, R"sql(
        INSERT INTO players (playfab_id, display_name, platform, platform_user_id, first_seen, last_seen)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
        ON CONFLICT(playfab_id) DO UPDATE SET
            display_name = excluded.display_name,
            platform = excluded.platform,
            platform_user_id = excluded.platform_user_id,
            first_seen = COALESCE(players.first_seen, excluded.first_seen),
            last_seen = MAX(COALESCE(players.last_seen, excluded.last_seen), excluded.last_seen)
    )sql");
    stmt.bind(1, player.playfab_id)
        .bind(2, player.display_name)
        .bind(3, player.platform)
        .bind(4, player.platform_user_id)
        .bind(5, player.first_seen)
        .bind(6, player.last_seen);

    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR("Failed to upsert player {}: {}", player.playfab_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool ScoreStore::upsert_daily_score(const DailyScore& score) {
    Statement stmt(db_, R"sql(
        INSERT OR REPLACE INTO daily_scores (stat_date, statistic_name, position, playfab_id, score)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )sql");
    stmt.bind(1, score.stat_date)
        .bind(2, score.statistic_name)
        .bind(3, score.position)
        .bind(4, score.playfab_id)
        .bind(5, score.score);

    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR("Failed to upsert daily score {} {}: {}",
                  format_date(score.stat_date), score.playfab_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<int64_t> ScoreStore::record_run(const RunAudit& run) {
    Statement stmt(db_, R"sql(
        INSERT INTO runs (stat_date, statistic_name, entry_count, api_version)
        VALUES (?1, ?2, ?3, ?4)
    )sql");
    stmt.bind(1, run.stat_date)
        .bind(2, run.statistic_name)
        .bind(3, run.entry_count)
        .bind(4, run.api_version);

    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR("Failed to record run: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

StoreResult<std::vector<DailyScore>> ScoreStore::daily_scores_between(Date first, Date last) const {
    Statement stmt(db_, R"sql(
        SELECT stat_date, statistic_name, playfab_id, position, score
        FROM daily_scores
        WHERE stat_date BETWEEN ?1 AND ?2
        ORDER BY stat_date ASC, position ASC
    )sql");
    stmt.bind(1, first).bind(2, last);

    std::vector<DailyScore> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back({
            .stat_date = stmt.date(0),
            .statistic_name = stmt.text(1),
            .playfab_id = stmt.text(2),
            .position = stmt.integer(3),
            .score = stmt.int64(4),
        });
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("daily_scores_between"));
    return rows;
}

StoreResult<std::optional<std::pair<Date, Date>>> ScoreStore::daily_date_range() const {
    Statement stmt(db_, "SELECT MIN(stat_date), MAX(stat_date) FROM daily_scores");
    if (stmt.step() != SQLITE_ROW) return std::unexpected(last_error("daily_date_range"));

    auto first = stmt.optional_date(0);
    auto last = stmt.optional_date(1);
    if (!first || !last) return std::optional<std::pair<Date, Date>>{};
    return std::optional<std::pair<Date, Date>>{std::pair{*first, *last}};
}

StoreResult<void> ScoreStore::replace_period(const Period& period,
                                             const std::vector<PeriodAggregate>& rows) {
    auto t = table_for(period.grain);

    return with_transaction([&]() -> StoreResult<void> {
        Statement del(db_, "DELETE FROM " + t.table + " WHERE " + t.start_col + " = ?1");
        del.bind(1, period.start);
        if (del.step() != SQLITE_DONE) return std::unexpected(last_error("delete " + t.table));

        Statement ins(db_, "INSERT INTO " + t.table + " (" + aggregate_columns(t, "") +
                           ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
        if (!ins.ok()) return std::unexpected(last_error("prepare insert " + t.table));

        for (auto& row : rows) {
            ins.reset();
            ins.bind(1, period.start)
                .bind(2, period.end)
                .bind(3, row.playfab_id)
                .bind(4, row.total_score)
                .bind(5, row.days_participated)
                .bind(6, row.average_score)
                .bind(7, row.best_daily_score)
                .bind(8, row.best_daily_date)
                .bind(9, row.position)
                .bind(10, row.calculated_at);
            if (ins.step() != SQLITE_DONE) {
                return std::unexpected(last_error("insert " + t.table + " " + row.playfab_id));
            }
        }
        return {};
    });
}

StoreResult<std::optional<Player>> ScoreStore::find_player(const std::string& playfab_id) const {
    Statement stmt(db_, R"sql(
        SELECT playfab_id, display_name, platform, platform_user_id, first_seen, last_seen
        FROM players WHERE playfab_id = ?1
    )sql");
    stmt.bind(1, playfab_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) return std::optional<Player>{read_player(stmt, 0)};
    if (rc == SQLITE_DONE) return std::optional<Player>{};
    return std::unexpected(last_error("find_player"));
}

StoreResult<std::vector<DailyLeaderboardRow>> ScoreStore::daily_leaderboard(Date stat_date) const {
    Statement stmt(db_, R"sql(
        SELECT ds.stat_date, ds.statistic_name, ds.position, ds.score,
               p.playfab_id, p.display_name, p.platform, p.platform_user_id,
               p.first_seen, p.last_seen
        FROM daily_scores ds
        JOIN players p ON ds.playfab_id = p.playfab_id
        WHERE ds.stat_date = ?1
        ORDER BY ds.position ASC
    )sql");
    stmt.bind(1, stat_date);

    std::vector<DailyLeaderboardRow> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        auto player = read_player(stmt, 4);
        DailyScore score{
            .stat_date = stmt.date(0),
            .statistic_name = stmt.text(1),
            .playfab_id = player.playfab_id,
            .position = stmt.integer(2),
            .score = stmt.int64(3),
        };
        rows.push_back({std::move(score), std::move(player)});
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("daily_leaderboard"));
    return rows;
}

StoreResult<std::optional<RunAudit>> ScoreStore::latest_run(Date stat_date) const {
    Statement stmt(db_, R"sql(
        SELECT id, stat_date, statistic_name, fetched_at, entry_count, api_version
        FROM runs
        WHERE stat_date = ?1
        ORDER BY fetched_at DESC, id DESC
        LIMIT 1
    )sql");
    stmt.bind(1, stat_date);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) return std::optional<RunAudit>{read_run(stmt)};
    if (rc == SQLITE_DONE) return std::optional<RunAudit>{};
    return std::unexpected(last_error("latest_run"));
}

StoreResult<std::vector<RunAudit>> ScoreStore::runs() const {
    Statement stmt(db_, R"sql(
        SELECT id, stat_date, statistic_name, fetched_at, entry_count, api_version
        FROM runs ORDER BY id ASC
    )sql");

    std::vector<RunAudit> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back(read_run(stmt));
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("runs"));
    return rows;
}

StoreResult<std::vector<PeriodAggregate>> ScoreStore::period_rows(const Period& period) const {
    auto t = table_for(period.grain);
    Statement stmt(db_, "SELECT " + aggregate_columns(t, "") + " FROM " + t.table +
                        " WHERE " + t.start_col + " = ?1 ORDER BY position ASC");
    stmt.bind(1, period.start);

    std::vector<PeriodAggregate> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back(read_aggregate(stmt, 0));
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("period_rows"));
    return rows;
}

StoreResult<std::vector<PeriodLeaderboardRow>> ScoreStore::period_leaderboard(
    const Period& period) const {

    auto t = table_for(period.grain);
    Statement stmt(db_, "SELECT " + aggregate_columns(t, "a") +
                        ", p.playfab_id, p.display_name, p.platform, p.platform_user_id,"
                        " p.first_seen, p.last_seen"
                        " FROM " + t.table + " a JOIN players p ON a.playfab_id = p.playfab_id"
                        " WHERE a." + t.start_col + " = ?1 ORDER BY a.position ASC");
    stmt.bind(1, period.start);

    std::vector<PeriodLeaderboardRow> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back({read_aggregate(stmt, 0), read_player(stmt, 10)});
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("period_leaderboard"));
    return rows;
}

StoreResult<std::vector<PeriodListing>> ScoreStore::list_periods(PeriodGrain grain) const {
    auto t = table_for(grain);
    Statement stmt(db_, "SELECT " + t.start_col + ", " + t.end_col +
                        ", COUNT(*), MAX(total_score) FROM " + t.table +
                        " GROUP BY " + t.start_col + " ORDER BY " + t.start_col + " DESC");

    std::vector<PeriodListing> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back({
            .period_start = stmt.date(0),
            .period_end = stmt.date(1),
            .player_count = stmt.integer(2),
            .top_score = stmt.int64(3),
        });
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("list_periods"));
    return rows;
}

StoreResult<std::vector<AllTimeRow>> ScoreStore::all_time_leaderboard() const {
    Statement stmt(db_, R"sql(
        SELECT p.playfab_id, p.display_name, p.platform, p.platform_user_id,
               p.first_seen, p.last_seen,
               COUNT(DISTINCT ds.stat_date),
               SUM(ds.score),
               AVG(ds.score),
               MAX(ds.score),
               MIN(ds.score),
               (SELECT ds2.stat_date FROM daily_scores ds2
                WHERE ds2.playfab_id = ds.playfab_id
                ORDER BY ds2.score DESC, ds2.stat_date ASC LIMIT 1)
        FROM daily_scores ds
        JOIN players p ON ds.playfab_id = p.playfab_id
        GROUP BY ds.playfab_id
        ORDER BY SUM(ds.score) DESC, ds.playfab_id ASC
    )sql");

    std::vector<AllTimeRow> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back({
            .player = read_player(stmt, 0),
            .days_played = stmt.integer(6),
            .total_score = stmt.int64(7),
            .average_score = stmt.real(8),
            .best_daily_score = stmt.int64(9),
            .worst_daily_score = stmt.int64(10),
            .best_day_date = stmt.date(11),
            .position = static_cast<int>(rows.size()),
        });
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("all_time_leaderboard"));
    return rows;
}

StoreResult<AllTimeStats> ScoreStore::all_time_stats() const {
    Statement stmt(db_, R"sql(
        SELECT COUNT(DISTINCT playfab_id),
               COUNT(DISTINCT stat_date),
               MIN(stat_date),
               MAX(stat_date),
               COALESCE(SUM(score), 0),
               COALESCE(AVG(score), 0),
               COALESCE(MAX(score), 0)
        FROM daily_scores
    )sql");
    if (stmt.step() != SQLITE_ROW) return std::unexpected(last_error("all_time_stats"));

    return AllTimeStats{
        .total_players = stmt.integer(0),
        .total_days = stmt.integer(1),
        .first_date = stmt.optional_date(2),
        .last_date = stmt.optional_date(3),
        .cumulative_score = stmt.int64(4),
        .average_daily_score = stmt.real(5),
        .highest_score_ever = stmt.int64(6),
    };
}

} // namespace fits
