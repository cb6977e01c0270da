#include "test.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include "acmeprotocol.hpp"
#include "fakes.hpp"
#include "jose.hpp"

namespace {
bool verifySignature(const KeyPair& key, const DecodedJws& jws)
{
    std::string sig = jws.signature;
    if (key.type() == KeyType::Ec) {
        if (sig.size() != 64) {
            return false;
        }
        const auto bytes = reinterpret_cast<const unsigned char*>(sig.data());
        auto ecdsaSig = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>(
            ECDSA_SIG_new(), ECDSA_SIG_free);
        ECDSA_SIG_set0(
            ecdsaSig.get(), BN_bin2bn(bytes, 32, nullptr), BN_bin2bn(bytes + 32, 32, nullptr));
        unsigned char* der = nullptr;
        const auto derLen = i2d_ECDSA_SIG(ecdsaSig.get(), &der);
        if (derLen <= 0) {
            return false;
        }
        sig.assign(reinterpret_cast<const char*>(der), static_cast<size_t>(derLen));
        OPENSSL_free(der);
    }

    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(
        EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.pkey()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(sig.data()),
               sig.size(), reinterpret_cast<const unsigned char*>(jws.signingInput.data()),
               jws.signingInput.size())
        == 1;
}

SignedRequest makeRequest(std::shared_ptr<const KeyPair> key, std::optional<std::string> kid,
    JwsPayload payload)
{
    return SignedRequest { std::move(key), std::move(kid), "nonce-abc",
        "https://ca/acme/new-order", std::move(payload) };
}
}

TEST_CASE("JWK thumbprint (RFC 7638 Section 3.1 example)")
{
    const std::string jwk
        = R"({"e":"AQAB","kty":"RSA","n":"0vx7agoebGcQSuuPiLJXZptN9nndrQmbXEps2aiAFbWhM78LhWx4)"
          R"(cbbfAAtVT86zwu1RK7aPFFxuhDR1L6tSoc_BJECPebWKRXjBZCiFV4n3oknjhMstn64tZ_2W-5JsGY4Hc5n9yBX)"
          R"(Arwl93lqt7_RN5w6Cf0h4QyQ5v-65YGjQR0_FDW2QvzqY368QQMicAtaSqzs8KJZgnYb9c7d0zgdAZHzu6qMQvR)"
          R"(L5hajrn1n91CbOpbISD08qNLyrdkt-bFTWhAI4vMQFh6WeZu0fM4lFd2NcRwr3XPksINHaQ-G_xBniIqbw0Ls1jF)"
          R"(44-csFCur-kEgU8awapJzKnqDKgw"})";
    TEST_CHECK(encodeBase64Url(sha256(jwk)) == "NzbLsXh8uDCcd-6MNwXF4W_7noWXFZAfHkxZsRGC9Xs");
}

TEST_CASE("EC KeyPair JWK")
{
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    TEST_CHECK(key->algorithm() == "ES256");
    const auto& jwk = key->jwk();
    TEST_CHECK(startsWith(jwk, R"({"crv":"P-256","kty":"EC","x":")"));
    auto json = minijson::parse(jwk);
    TEST_REQUIRE(json);
    TEST_REQUIRE((*json)["x"].isString() && (*json)["y"].isString());
    const auto x = decodeBase64Url(std::string((*json)["x"].asString()));
    const auto y = decodeBase64Url(std::string((*json)["y"].asString()));
    TEST_REQUIRE(x && y);
    TEST_CHECK(x->size() == 32);
    TEST_CHECK(y->size() == 32);
    TEST_CHECK(key->thumbprint() == encodeBase64Url(sha256(jwk)));
    TEST_CHECK(key->thumbprint().size() == 43);
}

TEST_CASE("RSA KeyPair JWK")
{
    const auto key = KeyPair::generate(KeyType::Rsa, 2048);
    TEST_REQUIRE(key);
    TEST_CHECK(key->algorithm() == "RS256");
    TEST_CHECK(startsWith(key->jwk(), R"({"e":"AQAB","kty":"RSA","n":")"));
}

TEST_CASE("KeyPair from PEM keeps the key")
{
    const auto pkey = generatePrivateKey(KeyType::Ec);
    TEST_REQUIRE(pkey);
    const auto pem = privateKeyToPem(pkey.get());
    TEST_REQUIRE(pem);
    const auto a = KeyPair::create(parsePrivateKey(*pem));
    const auto b = KeyPair::create(parsePrivateKey(*pem));
    TEST_REQUIRE(a && b);
    TEST_CHECK(a->jwk() == b->jwk());
    TEST_CHECK(!KeyPair::create(parsePrivateKey("not a key")));
}

TEST_CASE("KeyPair rejects EC keys on other 256 bit curves")
{
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), EVP_PKEY_CTX_free);
    TEST_REQUIRE(ctx);
    TEST_REQUIRE(EVP_PKEY_keygen_init(ctx.get()) > 0);
    TEST_REQUIRE(EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_secp256k1) > 0);
    EVP_PKEY* raw = nullptr;
    TEST_REQUIRE(EVP_PKEY_keygen(ctx.get(), &raw) > 0);
    PkeyPtr pkey(raw, EVP_PKEY_free);
    TEST_CHECK(EVP_PKEY_bits(pkey.get()) == 256);
    TEST_CHECK(!KeyPair::create(std::move(pkey)));
}

TEST_CASE("JWS with jwk for new accounts")
{
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    const auto jws = JwsSigner::createJws(
        makeRequest(key, std::nullopt, JwsPayload::json(R"({"termsOfServiceAgreed":true})")));
    TEST_REQUIRE(jws);
    const auto decoded = decodeJws(*jws);
    TEST_REQUIRE(decoded);
    TEST_CHECK(decoded->protectedHeader
        == R"({"alg":"ES256","jwk":)" + key->jwk()
            + R"(,"nonce":"nonce-abc","url":"https://ca/acme/new-order"})");
    TEST_CHECK(decoded->payload == R"({"termsOfServiceAgreed":true})");
    TEST_CHECK(verifySignature(*key, *decoded));
}

TEST_CASE("JWS with kid")
{
    const auto key = KeyPair::generate(KeyType::Rsa, 2048);
    TEST_REQUIRE(key);
    const auto jws = JwsSigner::createJws(
        makeRequest(key, "https://ca/acme/acct/1", JwsPayload::json("{}")));
    TEST_REQUIRE(jws);
    const auto decoded = decodeJws(*jws);
    TEST_REQUIRE(decoded);
    TEST_CHECK(decoded->protectedHeader
        == R"({"alg":"RS256","kid":"https://ca/acme/acct/1","nonce":"nonce-abc",)"
           R"("url":"https://ca/acme/new-order"})");
    TEST_CHECK(decoded->payload == "{}");
    TEST_CHECK(verifySignature(*key, *decoded));
}

TEST_CASE("POST-as-GET has an empty payload")
{
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    const auto jws
        = JwsSigner::createJws(makeRequest(key, "https://ca/acme/acct/1", JwsPayload::postAsGet()));
    TEST_REQUIRE(jws);
    TEST_CHECK(jws->find(R"("payload":"")") != std::string::npos);
    const auto decoded = decodeJws(*jws);
    TEST_REQUIRE(decoded);
    TEST_CHECK(decoded->payload.empty());
    TEST_CHECK(verifySignature(*key, *decoded));

    TEST_CHECK(JwsPayload::postAsGet().isPostAsGet());
    TEST_CHECK(!JwsPayload::json("").isPostAsGet());
}

TEST_CASE("JWS without key is a signing error")
{
    const auto jws = JwsSigner::createJws(makeRequest(nullptr, std::nullopt, JwsPayload::json("{}")));
    TEST_REQUIRE(!jws);
    TEST_CHECK(jws.error().kind == AcmeErrorKind::Signing);
}

TEST_CASE("JwsSigner posts application/jose+json")
{
    FakeTransport transport;
    JwsSigner signer(transport);
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    transport.reply(Method::Post, "https://ca/acme/new-order",
        makeResponse(StatusCode::Created, "{}", { { "Location", "https://ca/acme/order/1" } }));

    std::optional<Result<Response, AcmeError>> result;
    signer.signAndSend(makeRequest(key, "https://ca/acme/acct/1", JwsPayload::json("{}")),
        [&result](Result<Response, AcmeError>&& res) { result.emplace(std::move(res)); });
    TEST_REQUIRE(result && *result);
    TEST_CHECK((*result)->headers.get("Location") == std::optional<std::string_view>("https://ca/acme/order/1"));
    TEST_REQUIRE(transport.requests.size() == 1);
    TEST_CHECK(transport.requests[0].method == Method::Post);
    TEST_CHECK(transport.requests[0].headers.get("Content-Type")
        == std::optional<std::string_view>("application/jose+json"));
}

TEST_CASE("JwsSigner maps error responses")
{
    FakeTransport transport;
    JwsSigner signer(transport);
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    transport.reply(Method::Post, "https://ca/acme/new-order",
        makeResponse(StatusCode::Forbidden,
            R"({"type":"urn:ietf:params:acme:error:unauthorized","detail":"no"})"));

    std::optional<Result<Response, AcmeError>> result;
    signer.signAndSend(makeRequest(key, "https://ca/acme/acct/1", JwsPayload::json("{}")),
        [&result](Result<Response, AcmeError>&& res) { result.emplace(std::move(res)); });
    TEST_REQUIRE(result && !*result);
    const auto& err = result->error();
    TEST_CHECK(err.kind == AcmeErrorKind::Protocol);
    TEST_CHECK(err.status == StatusCode::Forbidden);
    TEST_REQUIRE(err.problem);
    TEST_CHECK(err.problem->type == "urn:ietf:params:acme:error:unauthorized");
    TEST_CHECK(!err.isBadNonce());
    TEST_CHECK(toString(err).find("no") != std::string::npos);
}

TEST_CASE("signAndSendJson decodes the response")
{
    FakeTransport transport;
    JwsSigner signer(transport);
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    transport.reply(Method::Post, "https://ca/acme/new-order",
        makeResponse(StatusCode::Ok, R"({"type":"dns","value":"example.com"})"));
    transport.reply(Method::Post, "https://ca/acme/new-order", makeResponse(StatusCode::Ok, "{}"));

    std::optional<Result<Identifier, AcmeError>> first;
    signAndSendJson<Identifier>(signer,
        makeRequest(key, "https://ca/acme/acct/1", JwsPayload::postAsGet()),
        [&first](Result<Identifier, AcmeError>&& res) { first.emplace(std::move(res)); });
    TEST_REQUIRE(first && *first);
    TEST_CHECK((*first)->value == "example.com");

    std::optional<Result<Identifier, AcmeError>> second;
    signAndSendJson<Identifier>(signer,
        makeRequest(key, "https://ca/acme/acct/1", JwsPayload::postAsGet()),
        [&second](Result<Identifier, AcmeError>&& res) { second.emplace(std::move(res)); });
    TEST_REQUIRE(second && !*second);
    TEST_CHECK(second->error().kind == AcmeErrorKind::Decode);
}
