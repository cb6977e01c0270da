#include "test.hpp"

#include "acmeprotocol.hpp"

namespace {
template <typename T>
std::optional<T> parseJson(std::string_view str)
{
    auto json = minijson::parse(str);
    if (!json) {
        return std::nullopt;
    }
    T value;
    if (!parse(*json, value)) {
        return std::nullopt;
    }
    return value;
}
}

TEST_CASE("Directory with optional members")
{
    const auto dir = parseJson<Directory>(
        R"({"keyChange":"https://ca/acme/key-change","meta":{"caaIdentities":["ca"],)"
        R"("termsOfService":"https://ca/tos.pdf","website":"https://ca"},)"
        R"("newAccount":"https://ca/acme/new-acct","newNonce":"https://ca/acme/new-nonce",)"
        R"("newOrder":"https://ca/acme/new-order","revokeCert":"https://ca/acme/revoke-cert",)"
        R"("AbCdEf":"https://community.letsencrypt.org/t/adding-random-entries/33417"})");
    TEST_REQUIRE(dir);
    TEST_CHECK(dir->newAccount == "https://ca/acme/new-acct");
    TEST_CHECK(dir->keyChange == std::optional<std::string>("https://ca/acme/key-change"));
    TEST_CHECK(dir->termsOfService == std::optional<std::string>("https://ca/tos.pdf"));
}

TEST_CASE("Directory requires the core endpoints")
{
    TEST_CHECK(!parseJson<Directory>(R"({"newNonce":"a","newAccount":"b"})"));
    TEST_CHECK(!parseJson<Directory>(R"({"newNonce":"a","newAccount":"b","newOrder":1})"));
    TEST_CHECK(!!parseJson<Directory>(R"({"newNonce":"a","newAccount":"b","newOrder":"c"})"));
}

TEST_CASE("OrderResponse")
{
    const auto order = parseJson<OrderResponse>(
        R"({"status":"invalid","expires":"2016-01-20T14:09:07.99Z",)"
        R"("identifiers":[{"type":"dns","value":"www.example.org"},)"
        R"({"type":"dns","value":"example.org"}],)"
        R"("authorizations":["https://ca/acme/authz/PAniVnsZcis","https://ca/acme/authz/r4HqLzrSrpI"],)"
        R"("finalize":"https://ca/acme/order/TOlocE8rfgo/finalize",)"
        R"("error":{"type":"urn:ietf:params:acme:error:unauthorized","detail":"no"}})");
    TEST_REQUIRE(order);
    TEST_CHECK(order->status == OrderStatus::Invalid);
    TEST_REQUIRE(order->identifiers.size() == 2);
    TEST_CHECK(order->identifiers[1].value == "example.org");
    TEST_CHECK(order->authorizations.size() == 2);
    TEST_CHECK(!order->certificate);
    TEST_REQUIRE(order->error);
    TEST_CHECK(order->error->type == "urn:ietf:params:acme:error:unauthorized");
    TEST_CHECK(!order->location);
}

TEST_CASE("OrderResponse rejects unknown status and wrong types")
{
    TEST_CHECK(!parseJson<OrderResponse>(
        R"({"status":"done","authorizations":[],"finalize":"https://ca/f"})"));
    TEST_CHECK(!parseJson<OrderResponse>(
        R"({"status":"ready","authorizations":[1],"finalize":"https://ca/f"})"));
    TEST_CHECK(!parseJson<OrderResponse>(
        R"({"status":"ready","authorizations":[],"finalize":"https://ca/f","certificate":5})"));
}

TEST_CASE("OrderResponse drops an out of range problem status")
{
    for (const auto status : { "-1", "1e12", "99", "600" }) {
        const auto order = parseJson<OrderResponse>(
            std::string(R"({"status":"invalid","authorizations":[],"finalize":"https://ca/f",)")
            + R"("error":{"type":"urn:ietf:params:acme:error:malformed","status":)" + status
            + "}}");
        TEST_REQUIRE(order);
        TEST_REQUIRE(order->error);
        TEST_CHECK(order->error->type == "urn:ietf:params:acme:error:malformed");
        TEST_CHECK(!order->error->status);
    }
    const auto order = parseJson<OrderResponse>(
        R"({"status":"invalid","authorizations":[],"finalize":"https://ca/f",)"
        R"("error":{"type":"urn:ietf:params:acme:error:serverInternal","status":500}})");
    TEST_REQUIRE(order);
    TEST_REQUIRE(order->error);
    TEST_CHECK(order->error->status == std::optional<uint32_t>(500));
}

TEST_CASE("AuthorizationResponse")
{
    const auto authz = parseJson<AuthorizationResponse>(
        R"({"status":"invalid","identifier":{"type":"dns","value":"example.org"},)"
        R"("wildcard":true,"challenges":[{"url":"https://ca/acme/chall/prV_B7yEyA4",)"
        R"("type":"http-01","status":"invalid","token":"DGyRejmCefe7v4NfDGDKfA",)"
        R"("error":{"type":"urn:ietf:params:acme:error:connection","detail":"timeout"}}]})");
    TEST_REQUIRE(authz);
    TEST_CHECK(authz->status == AuthorizationStatus::Invalid);
    TEST_CHECK(authz->wildcard);
    TEST_REQUIRE(authz->challenges.size() == 1);
    const auto& challenge = authz->challenges[0];
    TEST_CHECK(challenge.status == ChallengeStatus::Invalid);
    TEST_REQUIRE(challenge.error);
    TEST_CHECK(challenge.error->detail == "timeout");
}

TEST_CASE("Request payloads")
{
    TEST_CHECK(newAccountPayload()
        == R"({"onlyReturnExisting":false,"termsOfServiceAgreed":true,"contact":[]})");
    TEST_CHECK(newOrderPayload({ "a.example", "a.example" })
        == R"({"identifiers":[{"type":"dns","value":"a.example"},{"type":"dns","value":"a.example"}]})");
    TEST_CHECK(newOrderPayload({ "q\"uote" })
        == R"({"identifiers":[{"type":"dns","value":"q\"uote"}]})");
    TEST_CHECK(finalizePayload(std::string("\xfb\xff", 2)) == R"({"csr":"-_8"})");
}

TEST_CASE("Problem::parse")
{
    const auto problem = Problem::parse(
        R"({"type":"urn:ietf:params:acme:error:rateLimited","detail":"too many","status":429})");
    TEST_REQUIRE(problem);
    TEST_CHECK(problem->type == "urn:ietf:params:acme:error:rateLimited");
    TEST_CHECK(problem->detail == "too many");
    TEST_CHECK(problem->status == std::optional<uint32_t>(429));

    TEST_CHECK(!Problem::parse("<html>Bad Gateway</html>"));
    TEST_CHECK(!Problem::parse(R"({"detail":"no type"})"));
    TEST_CHECK(!Problem::parse(R"({"type":"about:blank","status":-1})")->status);
    TEST_CHECK(!Problem::parse(R"({"type":"about:blank","status":1e12})")->status);
}

TEST_CASE("AcmeError formatting")
{
    Response resp(StatusCode::BadRequest,
        R"({"type":"urn:ietf:params:acme:error:badNonce","detail":"JWS has an invalid anti-replay nonce"})");
    auto err = AcmeError::protocol("POST https://ca/acme/new-order failed", resp);
    err.withContext("new order");
    TEST_CHECK(err.isBadNonce());
    TEST_CHECK(toString(err)
        == "new order: POST https://ca/acme/new-order failed [status 400] "
           "urn:ietf:params:acme:error:badNonce: JWS has an invalid anti-replay nonce");

    const auto transport
        = AcmeError::transport("failed", std::make_error_code(std::errc::timed_out));
    TEST_CHECK(toString(transport).find("failed (") == 0);
    TEST_CHECK(!transport.isBadNonce());
    TEST_CHECK(toString(AcmeErrorKind::Decode) == "decode");
}
