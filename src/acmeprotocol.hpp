#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <minijson.hpp>

#include "acmeerror.hpp"

// RFC 8555 Section 7.1.1. Only newNonce, newAccount and newOrder are required.
struct Directory {
    std::string newNonce;
    std::string newAccount;
    std::string newOrder;
    std::optional<std::string> revokeCert;
    std::optional<std::string> keyChange;
    std::optional<std::string> termsOfService;
};

struct Identifier {
    std::string type;
    std::string value;
};

// RFC 8555 Section 7.1.6
enum class OrderStatus { Pending, Ready, Processing, Valid, Invalid };
enum class AuthorizationStatus { Pending, Valid, Invalid, Deactivated, Expired, Revoked };
enum class ChallengeStatus { Pending, Processing, Valid, Invalid };

std::string_view toString(OrderStatus status);
std::string_view toString(AuthorizationStatus status);
std::string_view toString(ChallengeStatus status);

struct Challenge {
    std::string type;
    std::string url;
    ChallengeStatus status = ChallengeStatus::Pending;
    // Not present for every challenge type
    std::optional<std::string> token;
    // Set by the CA if validation failed
    std::optional<Problem> error;
};

struct AuthorizationResponse {
    Identifier identifier;
    AuthorizationStatus status = AuthorizationStatus::Pending;
    std::vector<Challenge> challenges;
    std::optional<std::string> expires;
    bool wildcard = false;
};

struct OrderResponse {
    OrderStatus status = OrderStatus::Pending;
    std::vector<std::string> authorizations;
    std::string finalize;
    std::vector<Identifier> identifiers;
    std::optional<std::string> expires;
    std::optional<std::string> certificate;
    std::optional<Problem> error;
    // From the Location header of the response, if there was one
    std::optional<std::string> location;
};

bool parse(const minijson::JsonValue& json, std::string& s);
bool parse(const minijson::JsonValue& json, Directory& d);
bool parse(const minijson::JsonValue& json, Identifier& i);
bool parse(const minijson::JsonValue& json, OrderStatus& s);
bool parse(const minijson::JsonValue& json, AuthorizationStatus& s);
bool parse(const minijson::JsonValue& json, ChallengeStatus& s);
bool parse(const minijson::JsonValue& json, Problem& p);
bool parse(const minijson::JsonValue& json, Challenge& c);
bool parse(const minijson::JsonValue& json, AuthorizationResponse& a);
bool parse(const minijson::JsonValue& json, OrderResponse& o);

template <typename T>
bool parse(const minijson::JsonValue& json, std::vector<T>& v)
{
    if (!json.isArray()) {
        return false;
    }
    for (const auto& elem : json.asArray()) {
        if (!parse(elem, v.emplace_back())) {
            return false;
        }
    }
    return true;
}

// Leaves value empty if the member is missing, fails if it has the wrong type
template <typename T>
bool parseOptional(const minijson::JsonValue& json, std::optional<T>& value)
{
    if (json.isNull()) {
        value.reset();
        return true;
    }
    return parse(json, value.emplace());
}

// Request bodies
std::string newAccountPayload();
std::string newOrderPayload(const std::vector<std::string>& domains);
std::string finalizePayload(std::string_view csrDer);
