#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "acmeprotocol.hpp"
#include "jose.hpp"

// RFC 8555 Section 8.1
std::string keyAuthorization(std::string_view token, const KeyPair& accountKey);

// Section 8.3: tokens only contain characters of the base64url alphabet
bool isValidToken(std::string_view token);

// Path the key authorization has to be served under for http-01 (Section 8.3).
// Returns nullopt for tokens that are not valid.
std::optional<std::string> http01Path(std::string_view token);

// TXT record name and value for dns-01 (Section 8.4)
std::string dns01RecordName(std::string_view domain);
std::string dns01TxtValue(std::string_view keyAuthorization);

// Returns nullptr if the authorization offers no challenge of that type
const Challenge* findChallenge(const AuthorizationResponse& authz, std::string_view type);
