#include "jose.hpp"

#include <algorithm>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/objects.h>
#include <openssl/rsa.h>

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/core_names.h>
#endif

#include "base64.hpp"
#include "log.hpp"
#include "ssl.hpp"
#include "string.hpp"

namespace {
template <typename T, typename F>
auto makeUnique(T* ptr, F deleter)
{
    return std::unique_ptr<T, F>(ptr, deleter);
}

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

BignumPtr makeBignumPtr(BIGNUM* bn)
{
    return BignumPtr(bn, BN_free);
}

std::string bignumToBytes(const BIGNUM* bn, size_t padTo = 0)
{
    const auto numBytes = static_cast<size_t>(BN_num_bytes(bn));
    std::string bytes(std::max(numBytes, padTo), '\0');
    BN_bn2binpad(bn, reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
    return bytes;
}

std::optional<std::string> rsaJwk(EVP_PKEY* pkey)
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    BIGNUM* n = nullptr;
    BIGNUM* e = nullptr;
    EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_N, &n);
    EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_E, &e);
    const auto modulus = makeBignumPtr(n);
    const auto exponent = makeBignumPtr(e);
    if (!modulus || !exponent) {
        return std::nullopt;
    }
    const BIGNUM* nPtr = modulus.get();
    const BIGNUM* ePtr = exponent.get();
#else
    const auto rsa = EVP_PKEY_get0_RSA(pkey);
    if (!rsa) {
        return std::nullopt;
    }
    const BIGNUM* nPtr = nullptr;
    const BIGNUM* ePtr = nullptr;
    RSA_get0_key(rsa, &nPtr, &ePtr, nullptr);
    if (!nPtr || !ePtr) {
        return std::nullopt;
    }
#endif
    return "{\"e\":\"" + encodeBase64Url(bignumToBytes(ePtr)) + "\",\"kty\":\"RSA\",\"n\":\""
        + encodeBase64Url(bignumToBytes(nPtr)) + "\"}";
}

int ecCurveNid(EVP_PKEY* pkey)
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    char name[64];
    size_t len = 0;
    if (!EVP_PKEY_get_utf8_string_param(
            pkey, OSSL_PKEY_PARAM_GROUP_NAME, name, sizeof(name), &len)) {
        return NID_undef;
    }
    const auto nid = OBJ_sn2nid(name);
    return nid != NID_undef ? nid : EC_curve_nist2nid(name);
#else
    const auto ec = EVP_PKEY_get0_EC_KEY(pkey);
    if (!ec) {
        return NID_undef;
    }
    return EC_GROUP_get_curve_name(EC_KEY_get0_group(ec));
#endif
}

std::optional<std::string> ecJwk(EVP_PKEY* pkey)
{
    // Coordinates are padded to the field size (RFC 7518 Section 6.2.1.2)
    constexpr size_t coordSize = 32;
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    BIGNUM* xRaw = nullptr;
    BIGNUM* yRaw = nullptr;
    EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_X, &xRaw);
    EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_Y, &yRaw);
    const auto x = makeBignumPtr(xRaw);
    const auto y = makeBignumPtr(yRaw);
    if (!x || !y) {
        return std::nullopt;
    }
#else
    const auto ec = EVP_PKEY_get0_EC_KEY(pkey);
    if (!ec) {
        return std::nullopt;
    }
    const auto x = makeBignumPtr(BN_new());
    const auto y = makeBignumPtr(BN_new());
    if (!x || !y
        || !EC_POINT_get_affine_coordinates(
            EC_KEY_get0_group(ec), EC_KEY_get0_public_key(ec), x.get(), y.get(), nullptr)) {
        return std::nullopt;
    }
#endif
    return "{\"crv\":\"P-256\",\"kty\":\"EC\",\"x\":\""
        + encodeBase64Url(bignumToBytes(x.get(), coordSize)) + "\",\"y\":\""
        + encodeBase64Url(bignumToBytes(y.get(), coordSize)) + "\"}";
}

// EVP_DigestSign produces a DER encoded ECDSA-Sig-Value, JWS wants the raw integers
std::optional<std::string> derToRawEcdsaSignature(const std::string& der)
{
    constexpr size_t coordSize = 32;
    auto derPtr = reinterpret_cast<const unsigned char*>(der.data());
    auto sig = makeUnique(
        d2i_ECDSA_SIG(nullptr, &derPtr, static_cast<long>(der.size())), ECDSA_SIG_free);
    if (!sig) {
        return std::nullopt;
    }
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    if (static_cast<size_t>(BN_num_bytes(r)) > coordSize
        || static_cast<size_t>(BN_num_bytes(s)) > coordSize) {
        return std::nullopt;
    }
    return bignumToBytes(r, coordSize) + bignumToBytes(s, coordSize);
}
}

std::shared_ptr<const KeyPair> KeyPair::create(PkeyPtr pkey)
{
    if (!pkey) {
        return nullptr;
    }

    const auto baseId = EVP_PKEY_base_id(pkey.get());
    if (baseId == EVP_PKEY_EC) {
        // ES256 is only defined for P-256
        const auto nid = ecCurveNid(pkey.get());
        if (nid != NID_X9_62_prime256v1) {
            slog::error("Unsupported EC curve: ", nid == NID_undef ? "unknown" : OBJ_nid2sn(nid));
            return nullptr;
        }
        auto jwk = ecJwk(pkey.get());
        if (!jwk) {
            slog::error("Could not extract EC key parameters: ", getSslErrorString());
            return nullptr;
        }
        return std::shared_ptr<const KeyPair>(
            new KeyPair(std::move(pkey), KeyType::Ec, std::move(*jwk)));
    } else if (baseId == EVP_PKEY_RSA) {
        auto jwk = rsaJwk(pkey.get());
        if (!jwk) {
            slog::error("Could not extract RSA key parameters: ", getSslErrorString());
            return nullptr;
        }
        return std::shared_ptr<const KeyPair>(
            new KeyPair(std::move(pkey), KeyType::Rsa, std::move(*jwk)));
    }

    slog::error("Unsupported key type: ", baseId);
    return nullptr;
}

std::shared_ptr<const KeyPair> KeyPair::generate(KeyType type, size_t rsaBits)
{
    return create(generatePrivateKey(type, rsaBits));
}

KeyPair::KeyPair(PkeyPtr pkey, KeyType type, std::string jwk)
    : pkey_(std::move(pkey))
    , type_(type)
    , jwk_(std::move(jwk))
    , thumbprint_(encodeBase64Url(sha256(jwk_)))
{
}

KeyType KeyPair::type() const
{
    return type_;
}

std::string_view KeyPair::algorithm() const
{
    return type_ == KeyType::Ec ? "ES256" : "RS256";
}

const std::string& KeyPair::jwk() const
{
    return jwk_;
}

const std::string& KeyPair::thumbprint() const
{
    return thumbprint_;
}

std::optional<std::string> KeyPair::sign(std::string_view input) const
{
    const auto ctx = makeUnique(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1) {
        return std::nullopt;
    }
    if (EVP_DigestSignUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return std::nullopt;
    }
    size_t sigLen = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sigLen) != 1) {
        return std::nullopt;
    }
    std::string sig(sigLen, '\0');
    if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<uint8_t*>(sig.data()), &sigLen) != 1) {
        return std::nullopt;
    }
    sig.resize(sigLen);

    if (type_ == KeyType::Ec) {
        return derToRawEcdsaSignature(sig);
    }
    return sig;
}

EVP_PKEY* KeyPair::pkey() const
{
    return pkey_.get();
}

JwsPayload JwsPayload::json(std::string json)
{
    return JwsPayload(false, std::move(json));
}

JwsPayload JwsPayload::postAsGet()
{
    return JwsPayload(true, "");
}

JwsPayload::JwsPayload(bool postAsGet, std::string json)
    : postAsGet_(postAsGet)
    , json_(std::move(json))
{
}

bool JwsPayload::isPostAsGet() const
{
    return postAsGet_;
}

const std::string& JwsPayload::json() const
{
    return json_;
}

JwsSigner::JwsSigner(Transport& transport)
    : transport_(transport)
{
}

Result<std::string, AcmeError> JwsSigner::createJws(const SignedRequest& request)
{
    if (!request.key) {
        return error(AcmeError::signing("no key"));
    }

    std::string protect = "{\"alg\":" + jsonString(request.key->algorithm());
    if (request.kid) {
        protect += ",\"kid\":" + jsonString(*request.kid);
    } else {
        protect += ",\"jwk\":" + request.key->jwk();
    }
    protect += ",\"nonce\":" + jsonString(request.nonce);
    protect += ",\"url\":" + jsonString(request.url) + "}";

    const auto protectB64 = encodeBase64Url(protect);
    const auto payloadB64
        = request.payload.isPostAsGet() ? std::string() : encodeBase64Url(request.payload.json());

    const auto signature = request.key->sign(protectB64 + "." + payloadB64);
    if (!signature) {
        return error(AcmeError::signing("could not sign request: " + getSslErrorString()));
    }

    return "{\"protected\":\"" + protectB64 + "\",\"payload\":\"" + payloadB64
        + "\",\"signature\":\"" + encodeBase64Url(*signature) + "\"}";
}

void JwsSigner::signAndSend(const SignedRequest& request, Callback cb)
{
    auto jws = createJws(request);
    if (!jws) {
        cb(error(std::move(jws.error())));
        return;
    }

    HeaderMap<> headers;
    headers.add("Content-Type", "application/jose+json");
    transport_.request(Method::Post, request.url, headers, *jws,
        [url = request.url, cb = std::move(cb)](std::error_code ec, Response&& resp) {
            if (ec) {
                cb(error(AcmeError::transport("POST " + url + " failed", ec)));
                return;
            }
            if (!isSuccess(resp.status)) {
                cb(error(AcmeError::protocol("POST " + url + " failed", resp)));
                return;
            }
            cb(std::move(resp));
        });
}
