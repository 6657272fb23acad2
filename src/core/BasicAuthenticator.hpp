#ifndef BASICAUTHENTICATOR_HPP
#define BASICAUTHENTICATOR_HPP

#include <map>
#include <string>
#include <utility>

struct AuthResult {
    bool authenticated;
    std::string username;
    std::string error;

    static AuthResult Success(const std::string& username) {
        return AuthResult{true, username, ""};
    }

    static AuthResult Failure(const std::string& error) {
        return AuthResult{false, "", error};
    }
};

// HTTP Basic authentication against the configured users. Only SHA-256 hashes of the
// passwords are kept after construction.
class BasicAuthenticator {
public:
    explicit BasicAuthenticator(const std::map<std::string, std::string>& users);

    // authorization_header is the raw "Authorization" value, empty when absent.
    AuthResult authenticate(const std::string& authorization_header) const;

    bool hasUsers() const { return !password_hashes_.empty(); }

    static std::pair<std::string, std::string> parseBasicAuth(const std::string& authorization_header);
    static std::string base64Decode(const std::string& encoded);

private:
    std::map<std::string, std::string> password_hashes_;
};

#endif // BASICAUTHENTICATOR_HPP
