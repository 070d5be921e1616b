
#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;

int load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return -1;
    }

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = util::trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Ignoring malformed line in {}: {}", path, line);
            continue;
        }

        std::string key = util::trim(line.substr(0, eq));
        std::string value = util::trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) {
            continue;
        }

        // Variables from the real environment win
        if (std::getenv(key.c_str())) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++applied;
        }
    }
    return applied;
}

std::string read_secret(const std::string& file_env, const std::string& env) {
    const char* file_path = std::getenv(file_env.c_str());
    if (file_path) {
        std::ifstream file(file_path);
        if (file.is_open()) {
            std::string content;
            std::getline(file, content);
            return util::trim(content);
        }
        spdlog::warn("{} points to {}, which cannot be read", file_env, file_path);
    }

    return get_env_var(env);
}

Config Config::from_env() {
    Config config;

    config.env_file = get_env_var("ENV_FILE", config.env_file);
    int applied = load_env_file(config.env_file);
    if (applied >= 0) {
        spdlog::info("Loaded {} variables from {}", applied, config.env_file);
    }

    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);

    config.poll_interval_seconds = get_env_int("POLL_INTERVAL_SECONDS", config.poll_interval_seconds);
    config.prime_on_start = util::get_env_bool("PRIME_ON_START", config.prime_on_start);

    config.github_token = read_secret("GITHUB_TOKEN_FILE", "GITHUB_TOKEN");
    config.github_api_url = get_env_var("GITHUB_API_URL", config.github_api_url);
    config.github_timeout_ms = get_env_int("GITHUB_TIMEOUT_MS", config.github_timeout_ms);
    config.github_per_page = get_env_int("GITHUB_PER_PAGE", config.github_per_page);
    config.github_max_pages = get_env_int("GITHUB_MAX_PAGES", config.github_max_pages);

    config.printer_device = get_env_var("PRINTER_DEVICE", config.printer_device);
    config.printer_width = get_env_int("PRINTER_WIDTH", config.printer_width);
    config.printer_feed_lines = get_env_int("PRINTER_FEED_LINES", config.printer_feed_lines);

    config.health_host = get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = get_env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    if (poll_interval_seconds < 1) {
        throw std::runtime_error("POLL_INTERVAL_SECONDS must be at least 1");
    }

    if (github_timeout_ms <= 0) {
        throw std::runtime_error("GITHUB_TIMEOUT_MS must be positive");
    }

    if (github_per_page < 1 || github_per_page > 100) {
        throw std::runtime_error("GITHUB_PER_PAGE must be between 1 and 100");
    }

    if (github_max_pages < 1) {
        throw std::runtime_error("GITHUB_MAX_PAGES must be at least 1");
    }

    if (printer_width < 16) {
        throw std::runtime_error("PRINTER_WIDTH must be at least 16");
    }

    if (printer_feed_lines < 0 || printer_feed_lines > 255) {
        throw std::runtime_error("PRINTER_FEED_LINES must be between 0 and 255");
    }

    if (health_port < 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 0 and 65535");
    }
}
