#include "acmeprotocol.hpp"

#include "base64.hpp"
#include "string.hpp"

namespace {
template <typename Enum, size_t N>
bool parseEnum(const minijson::JsonValue& json, Enum& value, const Enum (&values)[N])
{
    if (!json.isString()) {
        return false;
    }
    for (const auto v : values) {
        if (json.asString() == toString(v)) {
            value = v;
            return true;
        }
    }
    return false;
}
}

std::string_view toString(OrderStatus status)
{
    switch (status) {
    case OrderStatus::Pending:
        return "pending";
    case OrderStatus::Ready:
        return "ready";
    case OrderStatus::Processing:
        return "processing";
    case OrderStatus::Valid:
        return "valid";
    case OrderStatus::Invalid:
        return "invalid";
    default:
        return "unknown";
    }
}

std::string_view toString(AuthorizationStatus status)
{
    switch (status) {
    case AuthorizationStatus::Pending:
        return "pending";
    case AuthorizationStatus::Valid:
        return "valid";
    case AuthorizationStatus::Invalid:
        return "invalid";
    case AuthorizationStatus::Deactivated:
        return "deactivated";
    case AuthorizationStatus::Expired:
        return "expired";
    case AuthorizationStatus::Revoked:
        return "revoked";
    default:
        return "unknown";
    }
}

std::string_view toString(ChallengeStatus status)
{
    switch (status) {
    case ChallengeStatus::Pending:
        return "pending";
    case ChallengeStatus::Processing:
        return "processing";
    case ChallengeStatus::Valid:
        return "valid";
    case ChallengeStatus::Invalid:
        return "invalid";
    default:
        return "unknown";
    }
}

bool parse(const minijson::JsonValue& json, std::string& s)
{
    if (!json.isString()) {
        return false;
    }
    s = json.asString();
    return true;
}

bool parse(const minijson::JsonValue& json, Directory& d)
{
    if (!parse(json["newNonce"], d.newNonce) || !parse(json["newAccount"], d.newAccount)
        || !parse(json["newOrder"], d.newOrder)) {
        return false;
    }
    return parseOptional(json["revokeCert"], d.revokeCert)
        && parseOptional(json["keyChange"], d.keyChange)
        && parseOptional(json["meta"]["termsOfService"], d.termsOfService);
}

bool parse(const minijson::JsonValue& json, Identifier& i)
{
    return parse(json["type"], i.type) && parse(json["value"], i.value);
}

bool parse(const minijson::JsonValue& json, OrderStatus& s)
{
    static constexpr OrderStatus values[] = { OrderStatus::Pending, OrderStatus::Ready,
        OrderStatus::Processing, OrderStatus::Valid, OrderStatus::Invalid };
    return parseEnum(json, s, values);
}

bool parse(const minijson::JsonValue& json, AuthorizationStatus& s)
{
    static constexpr AuthorizationStatus values[] = { AuthorizationStatus::Pending,
        AuthorizationStatus::Valid, AuthorizationStatus::Invalid, AuthorizationStatus::Deactivated,
        AuthorizationStatus::Expired, AuthorizationStatus::Revoked };
    return parseEnum(json, s, values);
}

bool parse(const minijson::JsonValue& json, ChallengeStatus& s)
{
    static constexpr ChallengeStatus values[] = { ChallengeStatus::Pending,
        ChallengeStatus::Processing, ChallengeStatus::Valid, ChallengeStatus::Invalid };
    return parseEnum(json, s, values);
}

bool parse(const minijson::JsonValue& json, Problem& p)
{
    if (!parse(json["type"], p.type)) {
        return false;
    }
    const auto detail = json["detail"];
    if (detail.isString()) {
        p.detail = detail.asString();
    }
    // RFC 7807 Section 3.1: the status is advisory, so a bogus one is dropped
    const auto status = json["status"];
    if (status.isNumber() && status.asNumber() >= 100 && status.asNumber() < 600) {
        p.status = static_cast<uint32_t>(status.asNumber());
    }
    return true;
}

bool parse(const minijson::JsonValue& json, Challenge& c)
{
    return parse(json["type"], c.type) && parse(json["url"], c.url)
        && parse(json["status"], c.status) && parseOptional(json["token"], c.token)
        && parseOptional(json["error"], c.error);
}

bool parse(const minijson::JsonValue& json, AuthorizationResponse& a)
{
    if (!parse(json["identifier"], a.identifier) || !parse(json["status"], a.status)
        || !parse(json["challenges"], a.challenges)) {
        return false;
    }
    const auto wildcard = json["wildcard"];
    if (wildcard.isBool()) {
        a.wildcard = wildcard.asBool();
    }
    return parseOptional(json["expires"], a.expires);
}

bool parse(const minijson::JsonValue& json, OrderResponse& o)
{
    if (!parse(json["status"], o.status) || !parse(json["authorizations"], o.authorizations)
        || !parse(json["finalize"], o.finalize)) {
        return false;
    }
    if (!json["identifiers"].isNull() && !parse(json["identifiers"], o.identifiers)) {
        return false;
    }
    return parseOptional(json["expires"], o.expires)
        && parseOptional(json["certificate"], o.certificate)
        && parseOptional(json["error"], o.error);
}

std::string newAccountPayload()
{
    return R"({"onlyReturnExisting":false,"termsOfServiceAgreed":true,"contact":[]})";
}

std::string newOrderPayload(const std::vector<std::string>& domains)
{
    std::string payload = "{\"identifiers\":[";
    for (size_t i = 0; i < domains.size(); ++i) {
        if (i > 0) {
            payload += ",";
        }
        payload += "{\"type\":\"dns\",\"value\":" + jsonString(domains[i]) + "}";
    }
    payload += "]}";
    return payload;
}

std::string finalizePayload(std::string_view csrDer)
{
    return "{\"csr\":\"" + encodeBase64Url(csrDer) + "\"}";
}
