#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../config/AppConfig.hpp" // For MetricsDefinitions

// Per-source cool-off after the upstream answers with a server error.
class CircuitBreaker {
public:
    CircuitBreaker(std::shared_ptr<ILogger> logger, std::shared_ptr<IStatsDClient> statsd_client)
        : logger_(logger), statsd_client_(statsd_client) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for CircuitBreaker");
        }
    }

    // True while the source is cooling off.
    bool isTripped(const std::string& source);

    void trip(const std::string& source, std::chrono::milliseconds coolDownDuration);

    void reset(const std::string& source);

private:
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> tripped_sources_;
};

#endif // CIRCUITBREAKER_HPP
