#include "CircuitBreaker.hpp"

bool CircuitBreaker::isTripped(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tripped_it = tripped_sources_.find(source);
    if (tripped_it == tripped_sources_.end()) {
        return false;
    }
    if (tripped_it->second > std::chrono::steady_clock::now()) {
        logger_->warn("Circuit breaker open for source: " + source);
        return true;
    }
    // Cool-off over
    tripped_sources_.erase(tripped_it);
    return false;
}

void CircuitBreaker::trip(const std::string& source, std::chrono::milliseconds coolDownDuration) {
    if (coolDownDuration.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tripped_sources_[source] = std::chrono::steady_clock::now() + coolDownDuration;
    statsd_client_->increment(MetricsDefinitions::CIRCUIT_BREAKER_TRIPPED);
    logger_->error("Tripping circuit breaker for source: " + source + " for " + std::to_string(coolDownDuration.count()) + "ms");
}

void CircuitBreaker::reset(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    tripped_sources_.erase(source);
}
