#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fits {

struct PlayFabConfig {
    std::string base_url = "https://d155a.playfabapi.com";
    std::string session_token;
    bool execute_requests = false; // dry-run unless explicitly enabled
    int connect_timeout_secs = 10;
    int read_timeout_secs = 30;
};

struct FetchConfig {
    int page_size = 50;
    std::chrono::milliseconds request_delay{100};
    std::string api_version = "v1";
    int max_pages = 10000;
};

struct AppConfig {
    PlayFabConfig playfab;
    FetchConfig fetch;
    std::filesystem::path db_path = "data/fits.db";
    std::filesystem::path log_path = "data/fits.log";
    std::string log_level = "info";
    int api_port = 8080;
};

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

// Builds the configuration from the process environment, falling back to
// the defaults above for anything unset or unparsable.
AppConfig load_config();

// Returns every problem found; empty means the config is usable.
// Creates the database and log directories when they are missing.
std::vector<std::string> validate_config(const AppConfig& config,
                                         bool require_credential);

} // namespace fits
