#pragma once

#include <string>

// Parsed form of the upstream statistics site URL.
struct SourceUrlInfo {
    std::string url;
    std::string host;
    int port = 80;
    std::string path = "/";
    bool is_https = false;

    bool operator==(const SourceUrlInfo& other) const {
        return url == other.url;
    }
};
