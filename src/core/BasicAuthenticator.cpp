#include <vector>

#include "BasicAuthenticator.hpp"
#include "KeyBuilder.hpp"
#include "../utils/Utils.hpp"

BasicAuthenticator::BasicAuthenticator(const std::map<std::string, std::string>& users) {
    for (const auto& [username, password] : users) {
        password_hashes_[username] = KeyBuilder::sha256Hex(password);
    }
}

AuthResult BasicAuthenticator::authenticate(const std::string& authorization_header) const {
    if (authorization_header.empty()) {
        return AuthResult::Failure("Missing Authorization header");
    }
    if (Utils::toLower(authorization_header.substr(0, 6)) != "basic ") {
        return AuthResult::Failure("Not Basic authentication");
    }

    auto [username, password] = parseBasicAuth(authorization_header);
    if (username.empty()) {
        return AuthResult::Failure("Invalid Basic Auth format");
    }

    auto it = password_hashes_.find(username);
    if (it == password_hashes_.end()) {
        return AuthResult::Failure("Unknown user");
    }
    if (KeyBuilder::sha256Hex(password) != it->second) {
        return AuthResult::Failure("Invalid password");
    }
    return AuthResult::Success(username);
}

std::pair<std::string, std::string> BasicAuthenticator::parseBasicAuth(const std::string& authorization_header) {
    if (authorization_header.size() <= 6) {
        return {"", ""};
    }
    std::string decoded = base64Decode(Utils::trim(authorization_header.substr(6)));

    size_t colon_pos = decoded.find(':');
    if (colon_pos == std::string::npos) {
        return {"", ""};
    }
    return {decoded.substr(0, colon_pos), decoded.substr(colon_pos + 1)};
}

std::string BasicAuthenticator::base64Decode(const std::string& encoded) {
    static const std::string base64_chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    std::vector<int> table(256, -1);
    for (int i = 0; i < 64; i++) {
        table[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    std::string decoded;
    int val = 0;
    int valb = -8;
    for (unsigned char c : encoded) {
        if (table[c] == -1) break;  // '=' padding or garbage ends the payload
        val = ((val << 6) + table[c]) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return decoded;
}
