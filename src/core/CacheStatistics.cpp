#include "CacheStatistics.hpp"

namespace {
    uint64_t read(const std::atomic<uint64_t>& counter) {
        return counter.load(std::memory_order_relaxed);
    }

    double hitRate(uint64_t hits, uint64_t misses) {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
}

json CacheStatistics::snapshot() const {
    return json{
        {"short_term", {
            {"hits", read(short_term_hits)},
            {"misses", read(short_term_misses)},
            {"hit_rate", hitRate(read(short_term_hits), read(short_term_misses))}
        }},
        {"live_fetch", {
            {"successes", read(fetch_successes)},
            {"failures", read(fetch_failures)}
        }},
        {"fallback", {
            {"hits", read(long_term_hits)},
            {"misses", read(long_term_misses)},
            {"hit_rate", hitRate(read(long_term_hits), read(long_term_misses))}
        }},
        {"csv_fallback", {
            {"hits", read(static_hits)},
            {"misses", read(static_misses)}
        }},
        {"volatile_store", {
            {"unavailable", read(store_unavailable)},
            {"write_failures", read(store_write_failures)},
            {"corrupt_payloads", read(corrupt_payloads)}
        }},
        {"data_unavailable", read(unavailable_outcomes)}
    };
}
