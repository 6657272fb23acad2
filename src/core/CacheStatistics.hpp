#pragma once

#include <atomic>
#include <cstdint>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Advisory counters shared by every resolution. Lock-free; a snapshot is not atomic as a whole.
class CacheStatistics {
public:
    std::atomic<uint64_t> short_term_hits{0};
    std::atomic<uint64_t> short_term_misses{0};
    std::atomic<uint64_t> long_term_hits{0};
    std::atomic<uint64_t> long_term_misses{0};
    std::atomic<uint64_t> static_hits{0};
    std::atomic<uint64_t> static_misses{0};
    std::atomic<uint64_t> fetch_successes{0};
    std::atomic<uint64_t> fetch_failures{0};
    std::atomic<uint64_t> store_unavailable{0};
    std::atomic<uint64_t> store_write_failures{0};
    std::atomic<uint64_t> corrupt_payloads{0};
    std::atomic<uint64_t> unavailable_outcomes{0};

    static void bump(std::atomic<uint64_t>& counter) {
        counter.fetch_add(1, std::memory_order_relaxed);
    }

    json snapshot() const;
};
