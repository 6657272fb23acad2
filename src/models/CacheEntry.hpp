#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "TableRecord.hpp"

using json = nlohmann::json;

// Which tier supplied a payload.
enum class Provenance {
    FRESH,
    SHORT_TERM,
    LONG_TERM,
    STATIC_FALLBACK
};

namespace ProvenanceUtils {
    // Value of the "cached" field in API responses: false | "short_term" | "fallback" | "csv_fallback"
    inline json toCachedFlag(Provenance provenance) {
        switch (provenance) {
            case Provenance::SHORT_TERM: return "short_term";
            case Provenance::LONG_TERM: return "fallback";
            case Provenance::STATIC_FALLBACK: return "csv_fallback";
            case Provenance::FRESH: break;
        }
        return false;
    }

    inline std::string toString(Provenance provenance) {
        switch (provenance) {
            case Provenance::FRESH: return "fresh";
            case Provenance::SHORT_TERM: return "short_term";
            case Provenance::LONG_TERM: return "fallback";
            case Provenance::STATIC_FALLBACK: return "csv_fallback";
        }
        return "unknown";
    }

    inline std::string dataSource(Provenance provenance) {
        switch (provenance) {
            case Provenance::FRESH: return "Fresh web scraping";
            case Provenance::SHORT_TERM: return "Redis short_term cache";
            case Provenance::LONG_TERM: return "Redis fallback cache";
            case Provenance::STATIC_FALLBACK: return "Local CSV files";
        }
        return "unknown";
    }

    inline std::string freshness(Provenance provenance) {
        switch (provenance) {
            case Provenance::FRESH: return "Real-time data";
            case Provenance::SHORT_TERM:
            case Provenance::LONG_TERM: return "Cached data";
            case Provenance::STATIC_FALLBACK: return "Static data from local files";
        }
        return "unknown";
    }
}

// A resolved payload plus where it came from. Built once by the coordinator, never mutated.
struct CacheEntry {
    std::shared_ptr<const TableRecord> payload;
    Provenance provenance;
    std::chrono::system_clock::time_point stored_at;
};
