#include "challenge.hpp"

#include "base64.hpp"

std::string keyAuthorization(std::string_view token, const KeyPair& accountKey)
{
    return std::string(token) + "." + accountKey.thumbprint();
}

bool isValidToken(std::string_view token)
{
    if (token.empty()) {
        return false;
    }
    for (const auto ch : token) {
        const auto alnum = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')
            || (ch >= '0' && ch <= '9');
        if (!alnum && ch != '-' && ch != '_') {
            return false;
        }
    }
    return true;
}

std::optional<std::string> http01Path(std::string_view token)
{
    if (!isValidToken(token)) {
        return std::nullopt;
    }
    return "/.well-known/acme-challenge/" + std::string(token);
}

std::string dns01RecordName(std::string_view domain)
{
    // The wildcard label is not part of the record name
    if (domain.substr(0, 2) == "*.") {
        domain = domain.substr(2);
    }
    return "_acme-challenge." + std::string(domain);
}

std::string dns01TxtValue(std::string_view keyAuthorization)
{
    return encodeBase64Url(sha256(keyAuthorization));
}

const Challenge* findChallenge(const AuthorizationResponse& authz, std::string_view type)
{
    for (const auto& challenge : authz.challenges) {
        if (challenge.type == type) {
            return &challenge;
        }
    }
    return nullptr;
}
