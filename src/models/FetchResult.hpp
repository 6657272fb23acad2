#pragma once

#include <memory>
#include <optional>
#include <string>

#include "TableRecord.hpp"

enum class FetchErrorKind {
    NETWORK,
    HTTP_STATUS,
    PARSE,
    TIMEOUT,
    CIRCUIT_OPEN,
    CANCELLED
};

struct FetchError {
    FetchErrorKind kind;
    std::string detail;
    int http_status = 0;

    std::string kindName() const {
        switch (kind) {
            case FetchErrorKind::NETWORK: return "network_error";
            case FetchErrorKind::HTTP_STATUS: return "http_status";
            case FetchErrorKind::PARSE: return "parse_error";
            case FetchErrorKind::TIMEOUT: return "timeout";
            case FetchErrorKind::CIRCUIT_OPEN: return "circuit_open";
            case FetchErrorKind::CANCELLED: return "cancelled";
        }
        return "unknown";
    }

    std::string to_string() const {
        return kindName() + (detail.empty() ? "" : ": " + detail);
    }
};

// Either a freshly scraped record or the reason there is none.
struct FetchResult {
    std::shared_ptr<const TableRecord> record;
    std::optional<FetchError> error;

    bool ok() const { return record != nullptr && !error; }

    static FetchResult success(TableRecord record) {
        return FetchResult{std::make_shared<const TableRecord>(std::move(record)), std::nullopt};
    }

    static FetchResult failure(FetchErrorKind kind, std::string detail, int http_status = 0) {
        return FetchResult{nullptr, FetchError{kind, std::move(detail), http_status}};
    }
};
