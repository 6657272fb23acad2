#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <map>
#include <regex>
#include <string>
#include <sstream>

#include "../models/SourceUrlInfo.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "vitify.code_exception";

    static std::string SHORT_TERM_HIT = "vitify.tier.short_term.hit";
    static std::string SHORT_TERM_MISS = "vitify.tier.short_term.miss";

    static std::string LIVE_FETCH_SUCCESS = "vitify.tier.live_fetch.success";
    static std::string LIVE_FETCH_FAILURE = "vitify.tier.live_fetch.failure";

    static std::string LONG_TERM_HIT = "vitify.tier.long_term.hit";
    static std::string LONG_TERM_MISS = "vitify.tier.long_term.miss";

    static std::string STATIC_FALLBACK_HIT = "vitify.tier.static_fallback.hit";
    static std::string STATIC_FALLBACK_MISS = "vitify.tier.static_fallback.miss";

    static std::string DATA_UNAVAILABLE = "vitify.data_unavailable";

    static std::string CIRCUIT_BREAKER_TRIPPED = "vitify.circuit_breaker.tripped";

    static std::string RESOLVE_TIME = "vitify.resolve_time";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?([^?#]*)?$)");
    static constexpr auto SHORT_CACHE_PREFIX = "short:";
    static constexpr auto FALLBACK_CACHE_PREFIX = "fallback:";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Upstream statistics site
    SourceUrlInfo source;

    // Basic auth credentials: username -> password
    std::map<std::string, std::string> users;

    // Volatile store (Redis) configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int redis_db;
    std::string redis_password;
    int redis_connect_timeout_in_millis;
    int redis_reconnect_interval_in_millis;
    int in_memory_cache_max_size;

    // Tier TTLs (seconds)
    int short_cache_ttl;
    int fallback_cache_ttl;

    // Static fallback store
    std::string csv_fallback_dir;
    int static_cache_max_size;
    int static_cache_ttl;

    // Server Configuration
    int frontend_port;
    int number_of_io_threads;
    int number_of_worker_threads;
    size_t max_response_queue_size;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Live fetch
    int fetch_timeout_in_millis;
    int source_circuit_breaker_cool_off_duration_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        source.url = "http://vitibrasil.cnpuv.embrapa.br/index.php";
        source.host = "vitibrasil.cnpuv.embrapa.br";
        source.port = 80;
        source.path = "/index.php";
        source.is_https = false;

        number_of_io_threads = 2;
        number_of_worker_threads = 8;
        max_response_queue_size = 16;
        fetch_timeout_in_millis = 30000;
        source_circuit_breaker_cool_off_duration_in_millis = 10000;

        // Configurable from Config
        use_redis = true;
        frontend_port = 5000;
        redis_host = "localhost";
        redis_port = 6379;
        redis_db = 0;
        redis_connect_timeout_in_millis = 5000;
        redis_reconnect_interval_in_millis = 2000;
        in_memory_cache_max_size = 10000;
        short_cache_ttl = 300;           // 5 minutes
        fallback_cache_ttl = 2592000;    // 30 days
        csv_fallback_dir = "data/fallback";
        static_cache_max_size = 100;
        static_cache_ttl = 3600;         // 1 hour
        log_level = LogUtils::LogLevel::INFO;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "frontend_port: " << frontend_port << std::endl
            << "number_of_io_threads: " << number_of_io_threads << std::endl
            << "number_of_worker_threads: " << number_of_worker_threads << std::endl
            << "// --- Volatile Store Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_db: " << redis_db << std::endl
            << "redis_password: " << (redis_password.empty() ? "<none>" : "****") << std::endl
            << "redis_connect_timeout_in_millis: " << redis_connect_timeout_in_millis << std::endl
            << "redis_reconnect_interval_in_millis: " << redis_reconnect_interval_in_millis << std::endl
            << "in_memory_cache_max_size: " << in_memory_cache_max_size << std::endl
            << "short_cache_ttl: " << short_cache_ttl << std::endl
            << "fallback_cache_ttl: " << fallback_cache_ttl << std::endl
            << "// --- Static Fallback Configuration --- //" << std::endl
            << "csv_fallback_dir: " << csv_fallback_dir << std::endl
            << "static_cache_max_size: " << static_cache_max_size << std::endl
            << "static_cache_ttl: " << static_cache_ttl << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "--- Live Fetch Configuration --- " << std::endl
            << "source_url: " << source.url << std::endl
            << "fetch_timeout_in_millis: " << fetch_timeout_in_millis << std::endl
            << "source_circuit_breaker_cool_off_duration_in_millis: " << source_circuit_breaker_cool_off_duration_in_millis << std::endl;

        ss << "--- Configured users ---" << std::endl;
        for (const auto& [user, password] : users) {
            ss << user << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
