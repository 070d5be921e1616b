
#pragma once

#include <string>

struct Config {
    // General
    std::string service_name = "notifier";
    std::string log_level = "info";
    std::string env_file = "config/.env";

    // Polling
    int poll_interval_seconds = 60;
    bool prime_on_start = true;

    // GitHub
    std::string github_token; // Optional; the provider stays unconfigured without it
    std::string github_api_url = "https://api.github.com";
    int github_timeout_ms = 30000;
    int github_per_page = 50;
    int github_max_pages = 5;

    // Printer
    std::string printer_device; // Empty: notifications go to the log instead
    int printer_width = 32;
    int printer_feed_lines = 3;

    // Health
    std::string health_host = "0.0.0.0";
    int health_port = 8085; // 0 disables the endpoint

    static Config from_env();
    void validate() const;
};

// Loads KEY=VALUE lines into the environment without overriding variables
// that are already set. Returns the number of variables applied, or -1 if
// the file could not be opened.
int load_env_file(const std::string& path);

// Reads the first line of the file named by <file_env>, falling back to the
// plain <env> variable, then to an empty string.
std::string read_secret(const std::string& file_env, const std::string& env);
