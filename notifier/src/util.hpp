
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace util {

void setup_logging(const std::string& service_name, const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_upper(const std::string& str);
std::string to_lower(const std::string& str);
std::string title_case(const std::string& str);
std::vector<std::string> split_words(const std::string& str);

// Time utilities
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::string format_minutes(const std::chrono::system_clock::time_point& tp);

// Parses "YYYY-MM-DDTHH:MM:SS" with an optional fraction and a trailing 'Z'
// or numeric offset. Result is UTC.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);

// Returns the URL tagged rel="next" in an RFC 8288 Link header, if any.
std::optional<std::string> parse_next_link(const std::string& link_header);

} // namespace util
