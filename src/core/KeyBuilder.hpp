#pragma once

#include <map>
#include <string>

// Derives tier-agnostic cache keys: "<endpoint>:<sha256 hex>" over the canonical
// JSON {"endpoint": e, "params": {...}} with allow-listed, non-empty, lower-cased
// parameter names. The tier prefix is added by the caller.
class KeyBuilder {
public:
    static std::string buildKey(const std::string& endpoint, const std::map<std::string, std::string>& params);

    // Allow-listed parameters after normalization, sorted by name.
    static std::map<std::string, std::string> normalizeParams(const std::string& endpoint,
                                                              const std::map<std::string, std::string>& params);

    static std::string sha256Hex(const std::string& input);
};
