#include "fits/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace fits {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') ||
         (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::optional<int> env_int(const std::string& key) {
    auto val = get_env(key);
    if (!val || val->empty()) return std::nullopt;
    try {
        size_t used = 0;
        int parsed = std::stoi(*val, &used);
        if (used != val->size()) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Directory that will hold `file`, created on demand. Empty string on success.
std::string check_writable_dir(const std::filesystem::path& file, const std::string& what) {
    auto dir = file.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return what + " directory cannot be created: " + dir.string() + " (" + ec.message() + ")";
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        return what + " directory is not writable: " + dir.string();
    }
    return "";
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = strip_quotes(trim(trimmed.substr(eq + 1)));

        if (!key.empty()) {
            vars[key] = val;
            ::setenv(key.c_str(), val.c_str(), 0); // don't overwrite existing
        }
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

AppConfig load_config() {
    AppConfig config;

    if (auto v = get_env("PLAYFAB_BASE_URL"); v && !v->empty()) {
        config.playfab.base_url = *v;
        while (config.playfab.base_url.size() > 1 && config.playfab.base_url.back() == '/') {
            config.playfab.base_url.pop_back();
        }
    }
    if (auto v = get_env("PLAYFAB_SESSION_TOKEN")) config.playfab.session_token = trim(*v);

    if (auto v = get_env("DB_PATH"); v && !v->empty()) config.db_path = *v;
    if (auto v = get_env("LOG_PATH"); v && !v->empty()) config.log_path = *v;
    if (auto v = get_env("LOG_LEVEL"); v && !v->empty()) config.log_level = lower(*v);
    if (auto v = get_env("API_VERSION"); v && !v->empty()) config.fetch.api_version = *v;

    if (auto n = env_int("API_MAX_RESULTS_PER_PAGE")) config.fetch.page_size = *n;
    if (auto n = env_int("API_REQUEST_DELAY_MS")) {
        config.fetch.request_delay = std::chrono::milliseconds(*n);
    }
    if (auto n = env_int("API_PORT")) config.api_port = *n;

    return config;
}

std::vector<std::string> validate_config(const AppConfig& config,
                                         bool require_credential) {
    std::vector<std::string> errors;

    if (require_credential && config.playfab.session_token.empty()) {
        errors.push_back("PLAYFAB_SESSION_TOKEN is not set");
    }
    if (config.fetch.page_size < 1 || config.fetch.page_size > 100) {
        errors.push_back("API_MAX_RESULTS_PER_PAGE must be between 1 and 100");
    }
    if (config.fetch.request_delay.count() < 0) {
        errors.push_back("API_REQUEST_DELAY_MS must not be negative");
    }
    if (config.api_port < 1 || config.api_port > 65535) {
        errors.push_back("API_PORT must be between 1 and 65535");
    }

    static const std::vector<std::string> levels = {"debug", "info", "warning", "error"};
    if (std::find(levels.begin(), levels.end(), config.log_level) == levels.end()) {
        errors.push_back("LOG_LEVEL must be one of debug, info, warning, error");
    }

    if (config.db_path != ":memory:") {
        if (auto err = check_writable_dir(config.db_path, "Database"); !err.empty()) {
            errors.push_back(err);
        }
    }
    if (auto err = check_writable_dir(config.log_path, "Log"); !err.empty()) {
        errors.push_back(err);
    }

    return errors;
}

} // namespace fits
