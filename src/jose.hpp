#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <minijson.hpp>

#include "acmeerror.hpp"
#include "crypto.hpp"
#include "function.hpp"
#include "http.hpp"
#include "result.hpp"
#include "transport.hpp"

// Immutable signing key. It is shared between the client and the signer and never modified, so it
// is passed around as std::shared_ptr<const KeyPair>.
class KeyPair {
public:
    // Returns nullptr for keys that are neither P-256 nor RSA
    static std::shared_ptr<const KeyPair> create(PkeyPtr pkey);
    static std::shared_ptr<const KeyPair> generate(KeyType type, size_t rsaBits = 2048);

    KeyType type() const;

    // JWS "alg": ES256 or RS256
    std::string_view algorithm() const;

    // Public key as JWK with the members in lexicographic order (RFC 7638 Section 3.3)
    const std::string& jwk() const;

    // base64url(SHA-256(jwk))
    const std::string& thumbprint() const;

    // Raw signature of SHA-256(input). For ES256 this is r || s (RFC 7518 Section 3.4).
    std::optional<std::string> sign(std::string_view input) const;

    EVP_PKEY* pkey() const;

private:
    KeyPair(PkeyPtr pkey, KeyType type, std::string jwk);

    PkeyPtr pkey_;
    KeyType type_;
    std::string jwk_;
    std::string thumbprint_;
};

// Payload of a signed request. POST-as-GET (RFC 8555 Section 6.3) has an empty payload, which is
// different from the JSON payload "{}".
class JwsPayload {
public:
    static JwsPayload json(std::string json);
    static JwsPayload postAsGet();

    bool isPostAsGet() const;
    const std::string& json() const;

private:
    JwsPayload(bool postAsGet, std::string json);

    bool postAsGet_;
    std::string json_;
};

struct SignedRequest {
    std::shared_ptr<const KeyPair> key;
    // Account URL. If empty, the JWK is put into the protected header instead.
    std::optional<std::string> kid;
    std::string nonce;
    std::string url;
    JwsPayload payload;
};

class RequestSigner {
public:
    using Callback = Function<void(Result<Response, AcmeError>&&)>;

    virtual ~RequestSigner() = default;

    // The callback receives the raw response if the status is 2xx, a Protocol error otherwise
    virtual void signAndSend(const SignedRequest& request, Callback cb) = 0;
};

// Signs with JWS (RFC 7515, flattened JSON serialization) and sends with a Transport
class JwsSigner : public RequestSigner {
public:
    JwsSigner(Transport& transport);

    void signAndSend(const SignedRequest& request, Callback cb) override;

    // Exposed for tests
    static Result<std::string, AcmeError> createJws(const SignedRequest& request);

private:
    Transport& transport_;
};

// Decodes a JSON response body into T, which needs a parse(const minijson::JsonValue&, T&)
// overload.
template <typename T>
Result<T, AcmeError> decodeJson(const Response& response)
{
    auto json = minijson::parse(response.body);
    if (!json) {
        return error(AcmeError::decode("invalid JSON: " + json.error().message));
    }
    T value;
    if (!parse(*json, value)) {
        return error(AcmeError::decode("unexpected JSON shape: " + (*json).dump("  ")));
    }
    return value;
}

template <typename T>
void signAndSendJson(
    RequestSigner& signer, const SignedRequest& request, Function<void(Result<T, AcmeError>&&)> cb)
{
    signer.signAndSend(request, [cb = std::move(cb)](Result<Response, AcmeError>&& res) {
        if (!res) {
            cb(error(std::move(res.error())));
            return;
        }
        cb(decodeJson<T>(*res));
    });
}
