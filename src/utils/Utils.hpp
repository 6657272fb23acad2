#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        std::string upper = toUpper(level);
        if (upper == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (upper == "INFO") return LogUtils::LogLevel::INFO;
        if (upper == "WARNING" || upper == "WARN") return LogUtils::LogLevel::WARN;
        if (upper == "CERROR" || upper == "ERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    static std::string toLower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
        return str;
    }

    static std::string toUpper(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
        return str;
    }

    // Percent-encodes a query component (spaces become '+', as form encoding does)
    static std::string urlEncode(const std::string& value) {
        std::ostringstream escaped;
        escaped.fill('0');
        escaped << std::hex << std::uppercase;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                escaped << c;
            } else if (c == ' ') {
                escaped << '+';
            } else {
                escaped << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return escaped.str();
    }

    // Decodes '+' and %XX sequences; malformed escapes are kept verbatim
    static std::string urlDecode(const std::string& value) {
        std::string decoded;
        decoded.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '+') {
                decoded += ' ';
            } else if (c == '%' && i + 2 < value.size()
                       && std::isxdigit(static_cast<unsigned char>(value[i + 1]))
                       && std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                decoded += c;
            }
        }
        return decoded;
    }

    // Splits "a=1&b=2" into a map. Later duplicates win.
    static map<string, string> parseQueryString(const std::string& query) {
        map<string, string> params;
        std::stringstream ss(query);
        std::string pair;
        while (std::getline(ss, pair, '&')) {
            if (pair.empty()) continue;
            size_t eq = pair.find('=');
            if (eq == string::npos) {
                params[urlDecode(pair)] = "";
            } else {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        return params;
    }

    static bool isValidUtf8(const std::string& text) {
        size_t i = 0;
        while (i < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            size_t extra;
            if (c < 0x80) {
                extra = 0;
            } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
                extra = 1;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
            } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
                extra = 3;
            } else {
                return false;
            }
            if (i + extra >= text.size()) {
                return false;
            }
            for (size_t k = 1; k <= extra; ++k) {
                if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                    return false;
                }
            }
            i += extra + 1;
        }
        return true;
    }

    // Legacy source files and pages are often ISO-8859-1
    static std::string latin1ToUtf8(const std::string& text) {
        std::string out;
        out.reserve(text.size() + text.size() / 4);
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 0x80) {
                out += ch;
            } else {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return out;
    }

    // Formats a time point as RFC 3339 UTC, e.g. 2024-05-01T12:00:00Z
    static std::string formatUtc(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
    #if defined(_WIN32) || defined(_WIN64)
        gmtime_s(&tm, &t);
    #else
        gmtime_r(&t, &tm);
    #endif
        std::ostringstream oss;
        oss << std::put_time(&tm, Constants::TIME_FORMAT) << "Z";
        return oss.str();
    }

    // Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and a trailing 'Z'
    static optional<std::chrono::system_clock::time_point> parseUtc(const std::string& text) {
        std::tm tm = {};
        std::istringstream iss(text);
        iss >> std::get_time(&tm, Constants::TIME_FORMAT);
        if (iss.fail()) {
            return std::nullopt;
        }
    #if defined(_WIN32) || defined(_WIN64)
        std::time_t t = _mkgmtime(&tm);
    #else
        std::time_t t = timegm(&tm);
    #endif
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one configuration entry. Returns false for unknown keys or invalid values.
    static bool applyConfigEntry(AppConfig& config, const string& key, const string& value) {
        auto setInt = [&key, &value](int& target, int min_value, int max_value) {
            auto val = stringToInt(value);
            if (!val || *val < min_value || *val > max_value) {
                cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
                return false;
            }
            target = *val;
            return true;
        };

        if (key == "frontend_port" || key == "port") {
            return setInt(config.frontend_port, 1, 65535);
        } else if (key == "number_of_io_threads") {
            return setInt(config.number_of_io_threads, 1, 256);
        } else if (key == "number_of_worker_threads") {
            return setInt(config.number_of_worker_threads, 1, 1024);
        } else if (key == "use_redis") {
            int flag = config.use_redis ? 1 : 0;
            if (!setInt(flag, 0, 1)) return false;
            config.use_redis = (flag == 1);
            return true;
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            return setInt(config.redis_port, 1, 65535);
        } else if (key == "redis_db") {
            return setInt(config.redis_db, 0, 1024);
        } else if (key == "redis_password") {
            config.redis_password = value;
            return true;
        } else if (key == "redis_connect_timeout_in_millis") {
            return setInt(config.redis_connect_timeout_in_millis, 1, 600000);
        } else if (key == "redis_reconnect_interval_in_millis") {
            return setInt(config.redis_reconnect_interval_in_millis, 0, 600000);
        } else if (key == "in_memory_cache_max_size") {
            return setInt(config.in_memory_cache_max_size, 1, 100000000);
        } else if (key == "short_cache_ttl") {
            return setInt(config.short_cache_ttl, 1, 2147483647);
        } else if (key == "fallback_cache_ttl") {
            return setInt(config.fallback_cache_ttl, 1, 2147483647);
        } else if (key == "csv_fallback_dir") {
            config.csv_fallback_dir = value;
            return true;
        } else if (key == "static_cache_max_size") {
            return setInt(config.static_cache_max_size, 1, 1000000);
        } else if (key == "static_cache_ttl") {
            if (!setInt(config.static_cache_ttl, 1, 2147483647)) return false;
            config.static_cache_ttl = std::max(60, config.static_cache_ttl); // Minimum 1 minute
            return true;
        } else if (key == "fetch_timeout_in_millis") {
            return setInt(config.fetch_timeout_in_millis, 1, 600000);
        } else if (key == "source_circuit_breaker_cool_off_duration_in_millis") {
            return setInt(config.source_circuit_breaker_cool_off_duration_in_millis, 0, 3600000);
        } else if (key == "metrics_batch_size") {
            return setInt(config.metrics_batch_size, 1, 100000);
        } else if (key == "metrics_send_interval") {
            return setInt(config.metrics_send_interval_in_millis, 1, 3600000);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
                return false;
            }
        } else if (key == "source_url" || key == "source") {
            SourceUrlInfo info;
            if (!parseUrl(value, &info)) {
                cerr << "Warning: Invalid source URL: '" << value << "'. Keeping " << config.source.url << endl;
                return false;
            }
            config.source = std::move(info);
            return true;
        } else if (key.rfind("user.", 0) == 0 && key.size() > 5) {
            config.users[key.substr(5)] = value;
            return true;
        }
        return false;
    }

    // Load configuration: defaults, then config file, then environment, then command-line arguments
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        std::vector<std::string> config_paths = {
            "vitify.config",              // Current directory
            "../vitify.config",           // Parent directory
            "/app/vitify.config",         // Docker container path
            "../../vitify.config"         // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        string key = trim(line.substr(0, delimiterPos));
                        string value = trim(line.substr(delimiterPos + 1));
                        if (!applyConfigEntry(config, key, value)) {
                            cerr << "Warning: Ignoring config file entry '" << key << "'" << endl;
                        }
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults, environment and command-line arguments." << endl;
        }

        // --- Environment overrides ---
        static const std::vector<std::pair<std::string, std::string>> env_keys = {
            {"REDIS_HOST", "redis_host"},
            {"REDIS_PORT", "redis_port"},
            {"REDIS_DB", "redis_db"},
            {"REDIS_PASSWORD", "redis_password"},
            {"SHORT_CACHE_TTL", "short_cache_ttl"},
            {"FALLBACK_CACHE_TTL", "fallback_cache_ttl"},
            {"CSV_FALLBACK_DIR", "csv_fallback_dir"},
            {"APP_PORT", "frontend_port"},
            {"LOG_LEVEL", "log_level"}
        };
        for (const auto& [env_name, key] : env_keys) {
            const char* env_value = std::getenv(env_name.c_str());
            if (env_value != nullptr && *env_value != '\0' && !applyConfigEntry(config, key, env_value)) {
                cerr << "Warning: Ignoring environment variable '" << env_name << "'" << endl;
            }
        }

        // --- Process StartUp Arguments ---
        for (const auto& [key, value] : startupArguments) {
            if (!applyConfigEntry(config, key, value)) {
                cerr << "Warning: Ignoring startup argument '" << key << "'" << endl;
            }
        }

        return config;
    }

    static bool parseUrl(const std::string& url, SourceUrlInfo* urlInfo) {
        std::smatch match;

        if (std::regex_match(url, match, Constants::url_regex)) {
            std::string scheme = match[1].str();
            bool is_https = (scheme == "https");
            int port;

            if (match[3].matched) { // Port is specified
                try {
                    port = std::stoi(match[3].str());
                    if (port <= 0 || port > 65535) {
                        std::cerr << "Warning: Invalid port number " << port << " in URL " << url << std::endl;
                        return false; // Invalid port range
                    }
                } catch (const std::out_of_range& e) {
                    std::cerr << "Error parsing port in URL " << url << ": " << e.what() << std::endl;
                    return false; // Port out of range
                }
            } else {
                // Default port based on scheme
                port = is_https ? 443 : 80;
            }
            urlInfo->url = url;
            urlInfo->host = match[2].str();
            urlInfo->port = port;
            urlInfo->path = (match[4].matched && !match[4].str().empty()) ? match[4].str() : "/";
            urlInfo->is_https = is_https;
            return true;
        }
        std::cerr << "Error: URL format does not match expected pattern: " << url << std::endl;
        return false; // URL format doesn't match
    }
};

#endif // UTILS_HPP
