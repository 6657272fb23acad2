#pragma once

#include <map>
#include <string>

#include "../models/FetchResult.hpp"

// Scrapes one endpoint from the upstream site. Blocks the calling worker until the
// result is known or the fetch deadline passes; never throws.
class ILiveFetcher {
public:
    virtual ~ILiveFetcher() = default;

    virtual FetchResult fetch(const std::string& endpoint, const std::map<std::string, std::string>& params) = 0;

    // Aborts in-flight fetches; later calls fail with CANCELLED.
    virtual void cancelAll() = 0;
};
