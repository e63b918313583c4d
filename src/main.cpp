#include "fits/aggregator.hpp"
#include "fits/api_server.hpp"
#include "fits/calendar.hpp"
#include "fits/config.hpp"
#include "fits/fetcher.hpp"
#include "fits/logging.hpp"
#include "fits/normalizer.hpp"
#include "fits/playfab_client.hpp"
#include "fits/report.hpp"
#include "fits/request_pacer.hpp"
#include "fits/score_store.hpp"
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

namespace {

struct CliArgs {
    std::string command;
    std::string target; // show daily|weekly|monthly|alltime
    std::optional<std::string> date;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> week;
    std::optional<std::string> month;
    std::optional<std::string> player;
    std::optional<int> port;
    int limit = 0;
    bool execute = false;
    bool init_db = false;
    bool quiet = false;
    bool all = false;
    fits::OutputFormat format = fits::OutputFormat::Table;
};

void print_usage() {
    std::cerr << R"(Usage: fits-leaderboard <command> [options]
  fetch [--date D | --from D [--to D]] [--execute] [--init-db] [--quiet]
                            Fetch daily leaderboards (dry-run unless --execute)
  weekly [--week D | --all] Rebuild the week containing D (default: today)
  monthly [--month YYYY-MM | --all]
                            Rebuild the given month (default: current)
  show <daily|weekly|monthly|alltime> [--date D] [--limit N] [--format table|csv]
                            Print a stored leaderboard
  around --player ID [--date D] [--limit N] [--execute]
                            Fetch the entries surrounding one player
  serve [--port N]          Run the read-only JSON API
  init-db                   Create the database schema
  --help                    Show this message

Dates are YYYY-MM-DD. Settings come from the environment or .env.
)";
}

const std::unordered_set<std::string> kCommands = {
    "fetch", "weekly", "monthly", "show", "around", "serve", "init-db",
};

const std::unordered_set<std::string> kSwitches = {
    "--execute", "--init-db", "--quiet", "--all",
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];
    if (!kCommands.contains(args.command)) {
        if (args.command != "--help" && args.command != "-h") {
            std::cerr << "Unknown command: " << args.command << "\n";
        }
        return std::nullopt;
    }

    int i = 2;
    if (args.command == "show") {
        if (argc < 3) {
            std::cerr << "show needs one of daily, weekly, monthly, alltime\n";
            return std::nullopt;
        }
        args.target = argv[2];
        if (args.target != "daily" && args.target != "weekly" &&
            args.target != "monthly" && args.target != "alltime") {
            std::cerr << "Unknown leaderboard: " << args.target << "\n";
            return std::nullopt;
        }
        i = 3;
    }

    try {
        while (i < argc) {
            std::string flag = argv[i];

            if (kSwitches.contains(flag)) {
                if (flag == "--execute") args.execute = true;
                else if (flag == "--init-db") args.init_db = true;
                else if (flag == "--quiet") args.quiet = true;
                else if (flag == "--all") args.all = true;
                ++i;
                continue;
            }

            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << "\n";
                return std::nullopt;
            }
            std::string val = argv[i + 1];

            if (flag == "--date") args.date = val;
            else if (flag == "--from") args.from = val;
            else if (flag == "--to") args.to = val;
            else if (flag == "--week") args.week = val;
            else if (flag == "--month") args.month = val;
            else if (flag == "--player") args.player = val;
            else if (flag == "--port") args.port = std::stoi(val);
            else if (flag == "--limit") args.limit = std::stoi(val);
            else if (flag == "--format") {
                if (val != "table" && val != "csv") {
                    std::cerr << "Unknown format: " << val << "\n";
                    return std::nullopt;
                }
                args.format = (val == "csv") ? fits::OutputFormat::Csv
                                             : fits::OutputFormat::Table;
            }
            else {
                std::cerr << "Unknown option: " << flag << "\n";
                return std::nullopt;
            }
            i += 2;
        }
    } catch (const std::exception&) {
        std::cerr << "Expected a number after " << argv[i] << "\n";
        return std::nullopt;
    }

    if (args.date && (args.from || args.to)) {
        std::cerr << "--date cannot be combined with --from/--to\n";
        return std::nullopt;
    }
    if (args.to && !args.from) {
        std::cerr << "--to requires --from\n";
        return std::nullopt;
    }
    if (args.command == "around" && !args.player) {
        std::cerr << "around requires --player\n";
        return std::nullopt;
    }

    return args;
}

std::optional<fits::Date> date_arg(const std::optional<std::string>& value) {
    if (!value) return fits::today_utc();
    auto parsed = fits::parse_date(*value);
    if (!parsed) {
        std::cerr << parsed.error() << " (got '" << *value << "')\n";
        return std::nullopt;
    }
    return *parsed;
}

bool ensure_schema(fits::ScoreStore& store) {
    if (auto ok = store.initialize_schema(); !ok) {
        std::cerr << "Schema initialization failed: " << ok.error().message << "\n";
        return false;
    }
    return true;
}

std::string label_for(const fits::ScoreStore& store, const std::string& playfab_id) {
    auto player = store.find_player(playfab_id);
    if (player && *player) return fits::player_label(**player);
    return playfab_id;
}

int run_init_db(const fits::AppConfig& config) {
    fits::ScoreStore store(config.db_path);
    if (!ensure_schema(store)) return 1;
    std::cout << "Schema ready at " << config.db_path.string() << "\n";
    return 0;
}

int run_fetch(const CliArgs& args, const fits::AppConfig& config) {
    std::vector<fits::Date> dates;
    if (args.from) {
        auto from = date_arg(args.from);
        auto to = date_arg(args.to);
        if (!from || !to) return 1;
        dates = fits::dates_between(*from, *to);
        if (dates.empty()) {
            std::cerr << "--from must not be after --to\n";
            return 1;
        }
    } else {
        auto date = date_arg(args.date);
        if (!date) return 1;
        dates.push_back(*date);
    }

    fits::ScoreStore store(config.db_path);
    if (args.init_db && !ensure_schema(store)) return 1;

    auto playfab = config.playfab;
    playfab.execute_requests = args.execute;
    fits::PlayFabClient client(playfab);
    if (client.dry_run()) {
        LOG_WARN("DRY RUN: no requests will be sent, pass --execute to fetch");
    }

    fits::RequestPacer pacer(config.fetch.request_delay);
    fits::LeaderboardFetcher fetcher(client, store, pacer, config.fetch);

    auto results = fetcher.fetch_dates(dates);

    bool all_ok = true;
    for (auto& r : results) {
        auto& s = r.summary;
        all_ok = all_ok && s.success;
        if (args.quiet) continue;

        std::string status = !s.success ? "FAILED" : (s.dry_run ? "DRY RUN" : "OK");
        std::cout << std::format("{} {:<16} {:<8} entries={} players={} scores={}\n",
                                 fits::format_date(r.stat_date), r.statistic_name, status,
                                 s.total_entries, s.players_updated, s.scores_updated);
    }
    return all_ok ? 0 : 1;
}

int run_aggregate(fits::PeriodGrain grain, const CliArgs& args, const fits::AppConfig& config) {
    fits::ScoreStore store(config.db_path);
    if (!ensure_schema(store)) return 1;

    fits::PeriodAggregator aggregator(store, grain);

    std::vector<fits::PeriodSummary> summaries;
    if (args.all) {
        auto all = aggregator.aggregate_all();
        if (!all) {
            std::cerr << "Aggregation failed: " << all.error().message << "\n";
            return 1;
        }
        summaries = std::move(*all);
    } else {
        std::optional<fits::Date> anchor;
        if (grain == fits::PeriodGrain::Month) {
            if (args.month) {
                auto parsed = fits::parse_month(*args.month);
                if (!parsed) {
                    std::cerr << parsed.error() << " (got '" << *args.month << "')\n";
                    return 1;
                }
                anchor = *parsed;
            } else {
                anchor = fits::today_utc();
            }
        } else {
            anchor = date_arg(args.week);
        }
        if (!anchor) return 1;

        auto summary = aggregator.aggregate(*anchor);
        if (!summary) {
            std::cerr << "Aggregation failed: " << summary.error().message << "\n";
            return 1;
        }
        summaries.push_back(std::move(*summary));
    }

    if (summaries.empty()) {
        std::cout << "No daily data stored yet.\n";
        return 0;
    }

    for (auto& s : summaries) {
        auto range = fits::format_date(s.period.start) + " to " + fits::format_date(s.period.end);
        if (s.skipped) {
            std::cout << fits::grain_name(grain) << " " << range << ": skipped (no data)\n";
            continue;
        }
        std::cout << fits::grain_name(grain) << " " << range << ": "
                  << s.players << " players\n";
        for (auto& top : s.top) {
            std::cout << std::format("  #{} {} total={} days={} avg={:.2f}\n",
                                     top.position + 1, label_for(store, top.playfab_id),
                                     top.total_score, top.days_participated,
                                     top.average_score);
        }
    }
    return 0;
}

int run_show(const CliArgs& args, const fits::AppConfig& config) {
    auto date = date_arg(args.date);
    if (!date) return 1;

    fits::ScoreStore store(config.db_path, true);

    if (args.target == "daily") {
        auto rows = store.daily_leaderboard(*date);
        auto run = store.latest_run(*date);
        if (!rows || !run) {
            std::cerr << "Query failed: " << (!rows ? rows.error() : run.error()).message << "\n";
            return 1;
        }
        fits::display_daily(*rows, *date, *run, args.format, args.limit);
        return 0;
    }

    if (args.target == "alltime") {
        auto rows = store.all_time_leaderboard();
        auto stats = store.all_time_stats();
        if (!rows || !stats) {
            std::cerr << "Query failed: " << (!rows ? rows.error() : stats.error()).message << "\n";
            return 1;
        }
        fits::display_all_time(*rows, *stats, args.format, args.limit);
        return 0;
    }

    auto grain = args.target == "weekly" ? fits::PeriodGrain::Week : fits::PeriodGrain::Month;
    auto period = fits::period_containing(grain, *date);
    auto rows = store.period_leaderboard(period);
    if (!rows) {
        std::cerr << "Query failed: " << rows.error().message << "\n";
        return 1;
    }
    fits::display_period(*rows, period, args.format, args.limit);
    return 0;
}

int run_around(const CliArgs& args, const fits::AppConfig& config) {
    auto date = date_arg(args.date);
    if (!date) return 1;

    auto playfab = config.playfab;
    playfab.execute_requests = args.execute;
    fits::PlayFabClient client(playfab);

    auto statistic = fits::statistic_name_for(*date);
    int max_results = args.limit > 0 ? args.limit : config.fetch.page_size;
    auto page = client.fetch_around_player(statistic, *args.player, max_results);
    if (!page) {
        std::cerr << "Fetch failed (" << fits::failure_kind_name(page.error().kind) << "): "
                  << page.error().message << "\n";
        return 1;
    }
    if (page->dry_run) {
        std::cout << "DRY RUN: pass --execute to query " << statistic << "\n";
        return 0;
    }

    for (auto& entry : page->entries) {
        auto player = fits::normalize_player(entry, *date);
        std::cout << std::format("#{:<5} {:<24} {:>8}{}\n", entry.position + 1,
                                 fits::player_label(player), entry.stat_value,
                                 entry.playfab_id == *args.player ? "  <" : "");
    }
    return 0;
}

int run_serve(const CliArgs& args, const fits::AppConfig& config) {
    int port = args.port.value_or(config.api_port);
    fits::ApiServer server(config);
    if (!server.listen("0.0.0.0", port)) {
        LOG_ERROR("Could not bind port {}", port);
        return 1;
    }
    return 0;
}

int dispatch(const CliArgs& args, const fits::AppConfig& config) {
    if (args.command == "init-db") return run_init_db(config);
    if (args.command == "fetch") return run_fetch(args, config);
    if (args.command == "weekly") return run_aggregate(fits::PeriodGrain::Week, args, config);
    if (args.command == "monthly") return run_aggregate(fits::PeriodGrain::Month, args, config);
    if (args.command == "show") return run_show(args, config);
    if (args.command == "around") return run_around(args, config);
    return run_serve(args, config);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        print_usage();
        return 0;
    }

    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    fits::load_env();
    auto config = fits::load_config();

    bool network = args->command == "fetch" || args->command == "around";
    auto errors = fits::validate_config(config, network && args->execute);
    if (!errors.empty()) {
        std::cerr << "Configuration errors:\n";
        for (auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
    }

    fits::Logger::init(config.log_path, config.log_level);

    int code = 1;
    try {
        code = dispatch(*args, config);
    } catch (const fits::StoreException& e) {
        LOG_ERROR("Database unavailable: {}", e.what());
        std::cerr << "Database error: " << e.what() << "\n";
    }

    fits::Logger::shutdown();
    return code;
}
