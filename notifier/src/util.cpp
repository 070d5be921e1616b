
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

void setup_logging(const std::string& service_name, const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    spdlog::set_default_logger(logger);

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::flush_on(spdlog::level::info);
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        std::string str = trim(value);
        int int_val = 0;
        auto result = std::from_chars(str.data(), str.data() + str.size(), int_val);
        if (result.ec == std::errc() && result.ptr == str.data() + str.size()) {
            return int_val;
        }
        spdlog::warn("Ignoring non-numeric value '{}' for {}", str, name);
    }
    return default_value;
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string str = to_lower(trim(value));
    if (str == "1" || str == "true" || str == "yes" || str == "on") {
        return true;
    }
    if (str == "0" || str == "false" || str == "no" || str == "off") {
        return false;
    }
    spdlog::warn("Ignoring non-boolean value '{}' for {}", str, name);
    return default_value;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string title_case(const std::string& str) {
    std::string out = str;
    bool at_word_start = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            ch = static_cast<char>(at_word_start ? std::toupper(c) : std::tolower(c));
            at_word_start = false;
        } else {
            at_word_start = true;
        }
    }
    return out;
}

std::vector<std::string> split_words(const std::string& str) {
    std::istringstream iss(str);
    std::vector<std::string> words;
    std::string word;

    while (iss >> word) {
        words.push_back(word);
    }

    return words;
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string format_minutes(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Fractional seconds
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits = (digits + "000").substr(0, 3);
        time += std::chrono::milliseconds(std::stoi(digits));
    }

    int next = ss.peek();
    if (next == 'Z' || next == 'z') {
        ss.get();
    } else if (next == '+' || next == '-') {
        char sign = static_cast<char>(ss.get());
        std::string digits;
        while (digits.size() < 4 && ss.peek() != std::char_traits<char>::eof()) {
            int c = ss.peek();
            if (c == ':') {
                ss.get();
                continue;
            }
            if (!std::isdigit(c)) {
                break;
            }
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.size() != 4) {
            return std::nullopt;
        }
        auto offset = std::chrono::hours(std::stoi(digits.substr(0, 2))) +
                      std::chrono::minutes(std::stoi(digits.substr(2, 2)));
        // Local time = UTC + offset
        time = sign == '+' ? time - offset : time + offset;
    }

    ss >> std::ws;
    if (!ss.eof()) {
        return std::nullopt;
    }
    return time;
}

std::optional<std::string> parse_next_link(const std::string& link_header) {
    std::stringstream ss(link_header);
    std::string part;

    while (std::getline(ss, part, ',')) {
        auto open = part.find('<');
        auto close = part.find('>', open == std::string::npos ? 0 : open);
        if (open == std::string::npos || close == std::string::npos) {
            continue;
        }
        std::string params = part.substr(close + 1);
        if (params.find("rel=\"next\"") != std::string::npos ||
            params.find("rel=next") != std::string::npos) {
            return part.substr(open + 1, close - open - 1);
        }
    }

    return std::nullopt;
}

} // namespace util
