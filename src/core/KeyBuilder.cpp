#include <iomanip>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include "KeyBuilder.hpp"
#include "../models/EndpointMapping.hpp"
#include "../utils/Utils.hpp"

using json = nlohmann::json;

std::map<std::string, std::string> KeyBuilder::normalizeParams(const std::string& endpoint,
                                                               const std::map<std::string, std::string>& params) {
    static const std::set<std::string> default_allow_list = {"year", "sub_option"};
    const EndpointMapping* mapping = EndpointCatalog::find(endpoint);
    const std::set<std::string>& allow_list = mapping ? mapping->key_params : default_allow_list;

    std::map<std::string, std::string> normalized;
    for (const auto& [raw_name, raw_value] : params) {
        std::string name = Utils::toLower(Utils::trim(raw_name));
        std::string value = Utils::trim(raw_value);
        if (value.empty() || allow_list.count(name) == 0) {
            continue;
        }
        normalized[name] = value;
    }
    return normalized;
}

std::string KeyBuilder::buildKey(const std::string& endpoint, const std::map<std::string, std::string>& params) {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    json canonical = {
        {"endpoint", endpoint},
        {"params", normalizeParams(endpoint, params)}
    };
    return endpoint + ":" + sha256Hex(canonical.dump());
}

std::string KeyBuilder::sha256Hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
