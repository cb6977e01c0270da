#include "test.hpp"

#include "acmeclient.hpp"
#include "fakes.hpp"

namespace {
const std::string directoryUrl = "https://ca/acme/directory";
const std::string newNonceUrl = "https://ca/acme/new-nonce";
const std::string newAccountUrl = "https://ca/acme/new-account";
const std::string newOrderUrl = "https://ca/acme/new-order";
const std::string accountUrl = "https://ca/acme/acct/1";
const std::string directoryJson = R"({"newNonce":"https://ca/acme/new-nonce",)"
                                  R"("newAccount":"https://ca/acme/new-account",)"
                                  R"("newOrder":"https://ca/acme/new-order"})";

const std::string orderJson = R"({"status":"pending","expires":"2026-01-01T00:00:00Z",)"
                              R"("identifiers":[{"type":"dns","value":"example.com"}],)"
                              R"("authorizations":["https://ca/acme/authz/1"],)"
                              R"("finalize":"https://ca/acme/order/1/finalize"})";

struct Fixture {
    FakeTransport transport;
    JwsSigner signer { transport };
    RecordingRecorder recorder;
    std::shared_ptr<const KeyPair> key = KeyPair::generate(KeyType::Ec);

    Fixture() { transport.serveNonces(newNonceUrl); }

    void scriptConstruction()
    {
        transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, directoryJson));
        transport.reply(Method::Post, newAccountUrl,
            makeResponse(StatusCode::Created, R"({"status":"valid"})",
                { { "Location", accountUrl } }));
    }

    Result<std::shared_ptr<AcmeClient>, AcmeError> construct()
    {
        std::optional<Result<std::shared_ptr<AcmeClient>, AcmeError>> result;
        AcmeClient::create(transport, signer, directoryUrl, key,
            [&result](Result<std::shared_ptr<AcmeClient>, AcmeError>&& res) {
                result.emplace(std::move(res));
            },
            recorder);
        // The fake transport completes synchronously
        if (!result) {
            return error(AcmeError::protocol("callback was not called"));
        }
        return std::move(*result);
    }

    std::shared_ptr<AcmeClient> constructOrNull()
    {
        scriptConstruction();
        auto client = construct();
        return client ? *client : nullptr;
    }

    std::optional<DecodedJws> lastJws() const
    {
        if (transport.requests.empty()) {
            return std::nullopt;
        }
        return decodeJws(transport.requests.back().body);
    }
};

template <typename T>
std::optional<Result<T, AcmeError>> capture(
    Function<void(AcmeClient::Callback<T>)> call)
{
    std::optional<Result<T, AcmeError>> result;
    call([&result](Result<T, AcmeError>&& res) { result.emplace(std::move(res)); });
    return result;
}

std::string protectedMember(const DecodedJws& jws, const std::string& name)
{
    auto json = minijson::parse(jws.protectedHeader);
    if (!json || !(*json)[name].isString()) {
        return "";
    }
    return std::string((*json)[name].asString());
}
}

TEST_CASE("AcmeClient constructs with directory and account")
{
    FakeTransport transport;
    JwsSigner signer(transport);
    RecordingRecorder recorder;
    transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, directoryJson));
    transport.reply(Method::Get, newNonceUrl,
        makeResponse(StatusCode::Ok, "", { { "replay-nonce", "abc123" } }));
    transport.reply(Method::Post, newAccountUrl,
        makeResponse(StatusCode::Created, "{}", { { "Location", accountUrl } }));

    std::shared_ptr<AcmeClient> client;
    AcmeClient::create(transport, signer, directoryUrl, KeyPair::generate(KeyType::Ec),
        [&client](Result<std::shared_ptr<AcmeClient>, AcmeError>&& res) {
            if (res) {
                client = *res;
            }
        },
        recorder);
    TEST_REQUIRE(client);
    TEST_CHECK(client->accountId() == accountUrl);
    TEST_CHECK(client->directory().newOrder == newOrderUrl);
    TEST_REQUIRE(transport.requests.size() == 3);
    TEST_CHECK(transport.requests[0].method == Method::Get);
    TEST_CHECK(transport.requests[1].url == newNonceUrl);

    const auto jws = decodeJws(transport.requests[2].body);
    TEST_REQUIRE(jws);
    TEST_CHECK(protectedMember(*jws, "nonce") == "abc123");
    TEST_CHECK(protectedMember(*jws, "url") == newAccountUrl);
    TEST_CHECK(protectedMember(*jws, "kid").empty());
    TEST_CHECK(jws->protectedHeader.find("\"jwk\":") != std::string::npos);
    TEST_CHECK(jws->payload
        == R"({"onlyReturnExisting":false,"termsOfServiceAgreed":true,"contact":[]})");

    const auto created = recorder.find("account created");
    TEST_REQUIRE(created);
    TEST_CHECK(created->get("kid") == accountUrl);
}

TEST_CASE("Account registration without Location fails")
{
    Fixture f;
    f.transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, directoryJson));
    f.transport.reply(Method::Post, newAccountUrl, makeResponse(StatusCode::Ok, "{}"));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(client.error().message.find("unable to get account id") != std::string::npos);
}

TEST_CASE("Account registration problem document is surfaced")
{
    Fixture f;
    f.transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, directoryJson));
    f.transport.reply(Method::Post, newAccountUrl,
        makeResponse(StatusCode::BadRequest,
            R"({"type":"urn:ietf:params:acme:error:badNonce","detail":"stale","status":400})",
            { { "Content-Type", "application/problem+json" } }));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(client.error().status == StatusCode::BadRequest);
    TEST_CHECK(client.error().isBadNonce());
    TEST_REQUIRE(client.error().problem);
    TEST_CHECK(client.error().problem->detail == "stale");
}

TEST_CASE("Directory fetch fails on non-success status")
{
    Fixture f;
    f.transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::NotFound, "nope"));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(client.error().status == StatusCode::NotFound);
    // Nothing after the directory
    TEST_CHECK(f.transport.requests.size() == 1);
}

TEST_CASE("Directory fetch fails on non-JSON body")
{
    Fixture f;
    f.transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, "<html></html>"));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Decode);
}

TEST_CASE("Directory fetch fails on missing endpoint")
{
    Fixture f;
    f.transport.reply(Method::Get, directoryUrl,
        makeResponse(StatusCode::Ok,
            R"({"newNonce":"https://ca/acme/new-nonce","newAccount":"https://ca/acme/new-account"})"));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Decode);
}

TEST_CASE("Directory fetch fails on transport error")
{
    Fixture f;
    f.transport.replyError(
        Method::Get, directoryUrl, std::make_error_code(std::errc::connection_reset));
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Transport);
    TEST_CHECK(client.error().transportError == std::errc::connection_reset);
}

TEST_CASE("AcmeClient::create without key fails")
{
    Fixture f;
    f.key = nullptr;
    f.scriptConstruction();
    const auto client = f.construct();
    TEST_REQUIRE(!client);
    TEST_CHECK(client.error().kind == AcmeErrorKind::Signing);
    TEST_CHECK(f.transport.requests.empty());
}

TEST_CASE("NonceSource returns the Replay-Nonce header")
{
    FakeTransport transport;
    transport.reply(Method::Get, newNonceUrl,
        makeResponse(StatusCode::Ok, "", { { "Replay-Nonce", "oFvnlFP1wIhRlYS2jTaXbA" } }));
    const Directory directory { newNonceUrl, newAccountUrl, newOrderUrl };
    std::optional<Result<std::string, AcmeError>> nonce;
    NonceSource::fetch(transport, directory, slog::LogRecorder::getDefault(),
        [&nonce](Result<std::string, AcmeError>&& res) { nonce.emplace(std::move(res)); });
    TEST_REQUIRE(nonce && *nonce);
    TEST_CHECK(**nonce == "oFvnlFP1wIhRlYS2jTaXbA");
}

TEST_CASE("NonceSource returns an empty nonce if the header is missing")
{
    FakeTransport transport;
    transport.reply(Method::Get, newNonceUrl, makeResponse(StatusCode::NoContent, ""));
    const Directory directory { newNonceUrl, newAccountUrl, newOrderUrl };
    std::optional<Result<std::string, AcmeError>> nonce;
    NonceSource::fetch(transport, directory, slog::LogRecorder::getDefault(),
        [&nonce](Result<std::string, AcmeError>&& res) { nonce.emplace(std::move(res)); });
    TEST_REQUIRE(nonce && *nonce);
    TEST_CHECK((*nonce)->empty());
}

TEST_CASE("Nonce endpoint failure is a protocol error")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);

    // Stop serving nonces automatically, the next nonce request gets a 500
    FakeTransport transport;
    transport.reply(Method::Get, newNonceUrl, makeResponse(StatusCode::InternalServerError, ""));
    std::optional<Result<std::string, AcmeError>> nonce;
    NonceSource::fetch(transport, client->directory(), f.recorder,
        [&nonce](Result<std::string, AcmeError>&& res) { nonce.emplace(std::move(res)); });
    TEST_REQUIRE(nonce);
    TEST_REQUIRE(!*nonce);
    TEST_CHECK(nonce->error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(nonce->error().status == StatusCode::InternalServerError);
    TEST_CHECK(client->accountId() == accountUrl);
    TEST_CHECK(client->directory().newNonce == newNonceUrl);
}

TEST_CASE("Nonce failure fails the operation without sending the signed request")
{
    FakeTransport transport;
    JwsSigner signer(transport);
    transport.reply(Method::Get, directoryUrl, makeResponse(StatusCode::Ok, directoryJson));
    transport.reply(
        Method::Get, newNonceUrl, makeResponse(StatusCode::Ok, "", { { "Replay-Nonce", "n1" } }));
    transport.reply(Method::Post, newAccountUrl,
        makeResponse(StatusCode::Created, "{}", { { "Location", accountUrl } }));
    transport.reply(Method::Get, newNonceUrl, makeResponse(StatusCode::InternalServerError, ""));

    std::shared_ptr<AcmeClient> client;
    AcmeClient::create(transport, signer, directoryUrl, KeyPair::generate(KeyType::Ec),
        [&client](Result<std::shared_ptr<AcmeClient>, AcmeError>&& res) {
            if (res) {
                client = *res;
            }
        });
    TEST_REQUIRE(client);

    const auto order = capture<OrderResponse>([&client](AcmeClient::Callback<OrderResponse> cb) {
        client->newOrder({ "example.com" }, std::move(cb));
    });
    TEST_REQUIRE(order && !*order);
    TEST_CHECK(order->error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(order->error().message.rfind("new order: ", 0) == 0);
    TEST_CHECK(transport.requestsTo(newOrderUrl).empty());
    TEST_CHECK(client->accountId() == accountUrl);
}

TEST_CASE("newOrder sends one dns identifier per domain in order")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    f.transport.reply(Method::Post, newOrderUrl,
        makeResponse(
            StatusCode::Created, orderJson, { { "Location", "https://ca/acme/order/1" } }));

    const auto order = capture<OrderResponse>([&client](AcmeClient::Callback<OrderResponse> cb) {
        client->newOrder({ "example.com", "www.example.com" }, std::move(cb));
    });
    TEST_REQUIRE(order && *order);
    TEST_CHECK((*order)->status == OrderStatus::Pending);
    TEST_CHECK((*order)->location == std::optional<std::string>("https://ca/acme/order/1"));
    TEST_REQUIRE((*order)->authorizations.size() == 1);
    TEST_CHECK((*order)->finalize == "https://ca/acme/order/1/finalize");

    const auto jws = f.lastJws();
    TEST_REQUIRE(jws);
    TEST_CHECK(jws->payload
        == R"({"identifiers":[{"type":"dns","value":"example.com"},)"
           R"({"type":"dns","value":"www.example.com"}]})");
    TEST_CHECK(protectedMember(*jws, "kid") == accountUrl);
    TEST_CHECK(protectedMember(*jws, "url") == newOrderUrl);
    TEST_CHECK(jws->protectedHeader.find("\"jwk\"") == std::string::npos);
}

TEST_CASE("newOrder keeps duplicates and order for any domain list")
{
    const std::vector<std::vector<std::string>> domainLists = {
        { "a.example" },
        { "b.example", "a.example", "c.example" },
        { "dup.example", "dup.example" },
    };
    for (const auto& domains : domainLists) {
        Fixture f;
        auto client = f.constructOrNull();
        TEST_REQUIRE(client);
        f.transport.reply(Method::Post, newOrderUrl, makeResponse(StatusCode::Created, orderJson));
        const auto order = capture<OrderResponse>(
            [&client, &domains](AcmeClient::Callback<OrderResponse> cb) {
                client->newOrder(domains, std::move(cb));
            });
        TEST_REQUIRE(order && *order);

        const auto jws = f.lastJws();
        TEST_REQUIRE(jws);
        auto payload = minijson::parse(jws->payload);
        TEST_REQUIRE(payload);
        const auto identifiers = (*payload)["identifiers"];
        TEST_REQUIRE(identifiers.isArray());
        const auto& arr = identifiers.asArray();
        TEST_REQUIRE(arr.size() == domains.size());
        for (size_t i = 0; i < domains.size(); ++i) {
            TEST_CHECK(arr[i]["type"].asString() == "dns");
            TEST_CHECK(arr[i]["value"].asString() == domains[i]);
        }
    }
}

TEST_CASE("newOrder with no domains fails without network")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const auto numRequests = f.transport.requests.size();
    const auto order = capture<OrderResponse>([&client](AcmeClient::Callback<OrderResponse> cb) {
        client->newOrder({}, std::move(cb));
    });
    TEST_REQUIRE(order && !*order);
    TEST_CHECK(order->error().kind == AcmeErrorKind::Protocol);
    TEST_CHECK(f.transport.requests.size() == numRequests);
}

TEST_CASE("newOrder with malformed order is a decode error")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    f.transport.reply(
        Method::Post, newOrderUrl, makeResponse(StatusCode::Created, R"({"status":"pending"})"));
    const auto order = capture<OrderResponse>([&client](AcmeClient::Callback<OrderResponse> cb) {
        client->newOrder({ "example.com" }, std::move(cb));
    });
    TEST_REQUIRE(order && !*order);
    TEST_CHECK(order->error().kind == AcmeErrorKind::Decode);
}

TEST_CASE("fetchAuthorization is POST-as-GET")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const std::string authUrl = "https://ca/acme/authz/1";
    f.transport.reply(Method::Post, authUrl,
        makeResponse(StatusCode::Ok,
            R"({"identifier":{"type":"dns","value":"example.com"},"status":"pending",)"
            R"("challenges":[{"type":"http-01","url":"https://ca/acme/chall/1",)"
            R"("status":"pending","token":"tok1"},{"type":"dns-01",)"
            R"("url":"https://ca/acme/chall/2","status":"pending","token":"tok2"}]})"));

    const auto authz = capture<AuthorizationResponse>(
        [&](AcmeClient::Callback<AuthorizationResponse> cb) {
            client->fetchAuthorization(authUrl, std::move(cb));
        });
    TEST_REQUIRE(authz && *authz);
    TEST_CHECK((*authz)->identifier.value == "example.com");
    TEST_CHECK((*authz)->status == AuthorizationStatus::Pending);
    TEST_REQUIRE((*authz)->challenges.size() == 2);
    TEST_CHECK((*authz)->challenges[0].token == std::optional<std::string>("tok1"));

    const auto jws = f.lastJws();
    TEST_REQUIRE(jws);
    TEST_CHECK(jws->payload.empty());
    TEST_CHECK(protectedMember(*jws, "url") == authUrl);

    const auto ev = f.recorder.find("authorization response");
    TEST_REQUIRE(ev);
    TEST_CHECK(ev->get("identifier") == std::optional<std::string>("dns:example.com"));
}

TEST_CASE("triggerChallenge sends an empty object and not the domain")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const std::string challengeUrl = "https://ca/acme/chall/1";
    f.transport.reply(Method::Post, challengeUrl,
        makeResponse(StatusCode::Ok, R"({"type":"http-01","status":"processing"})"));

    const auto res = capture<void>([&](AcmeClient::Callback<void> cb) {
        client->triggerChallenge("secret.example.com", challengeUrl, std::move(cb));
    });
    TEST_REQUIRE(res);
    TEST_CHECK(res->hasValue());
    const auto jws = f.lastJws();
    TEST_REQUIRE(jws);
    TEST_CHECK(jws->payload == "{}");
    TEST_CHECK(f.transport.requests.back().body.find("secret") == std::string::npos);
    TEST_CHECK(jws->protectedHeader.find("secret") == std::string::npos);
}

TEST_CASE("submitCsr uses URL-safe base64 without padding")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const std::string finalizeUrl = "https://ca/acme/order/1/finalize";
    f.transport.reply(Method::Post, finalizeUrl,
        makeResponse(StatusCode::Ok,
            R"({"status":"valid","authorizations":[],"finalize":")" + finalizeUrl
                + R"(","certificate":"https://ca/acme/cert/1"})"));

    // Bytes that produce '+', '/' and padding in standard base64
    const std::string csr = "\xfb\xff\xbf\xfe\x00\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0a\x0b"
                            "\x0c\x0d\x0e\x0f\xff\xfe\xfd\xfc\xfb\xfa\xf9\xf8\xf7\xf6\xf5\xf4"
                            "\xf3\xf2\xf1\xf0\xef\xee\xed\xec\xeb\xea\xe9\xe8\xe7\xe6\xe5\xe4"
                            "\xe3\xe2\xe1\xe0\xdf\xde\xdd\xdc\xdb\xda\xd9\xd8\xd7\xd6\xd5\xd4"
                            "\x3e\x3f";
    const auto order = capture<OrderResponse>([&](AcmeClient::Callback<OrderResponse> cb) {
        client->submitCsr(finalizeUrl, csr, std::move(cb));
    });
    TEST_REQUIRE(order && *order);
    TEST_CHECK((*order)->certificate == std::optional<std::string>("https://ca/acme/cert/1"));

    const auto jws = f.lastJws();
    TEST_REQUIRE(jws);
    auto payload = minijson::parse(jws->payload);
    TEST_REQUIRE(payload);
    TEST_REQUIRE((*payload)["csr"].isString());
    const auto encoded = std::string((*payload)["csr"].asString());
    TEST_CHECK(encoded.find_first_not_of(
                   "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_")
        == std::string::npos);
    TEST_CHECK(decodeBase64Url(encoded) == std::optional<std::string>(csr));
}

TEST_CASE("downloadCertificate is idempotent and draws a nonce per call")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const std::string certUrl = "https://ca/acme/cert/1";
    const std::string chain = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n"
                              "-----BEGIN CERTIFICATE-----\nMIIC\n-----END CERTIFICATE-----\n";
    f.transport.reply(Method::Post, certUrl,
        makeResponse(StatusCode::Ok, chain,
            { { "Content-Type", "application/pem-certificate-chain" } }));
    f.transport.reply(Method::Post, certUrl,
        makeResponse(StatusCode::Ok, chain,
            { { "Content-Type", "application/pem-certificate-chain" } }));

    const auto noncesBefore = f.transport.noncesServed;
    const auto first = capture<std::string>([&](AcmeClient::Callback<std::string> cb) {
        client->downloadCertificate(certUrl, std::move(cb));
    });
    const auto second = capture<std::string>([&](AcmeClient::Callback<std::string> cb) {
        client->downloadCertificate(certUrl, std::move(cb));
    });
    TEST_REQUIRE(first && *first && second && *second);
    TEST_CHECK(**first == chain);
    TEST_CHECK(**first == **second);
    TEST_CHECK(f.transport.noncesServed == noncesBefore + 2);

    const auto posts = f.transport.requestsTo(certUrl);
    TEST_REQUIRE(posts.size() == 2);
    const auto jws1 = decodeJws(posts[0]->body);
    const auto jws2 = decodeJws(posts[1]->body);
    TEST_REQUIRE(jws1 && jws2);
    TEST_CHECK(jws1->payload.empty());
    TEST_CHECK(protectedMember(*jws1, "nonce") != protectedMember(*jws2, "nonce"));
}

TEST_CASE("Every signed request uses a fresh nonce")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    f.transport.reply(Method::Post, newOrderUrl, makeResponse(StatusCode::Created, orderJson));
    f.transport.reply(Method::Post, newOrderUrl, makeResponse(StatusCode::Created, orderJson));
    for (int i = 0; i < 2; ++i) {
        const auto order = capture<OrderResponse>([&](AcmeClient::Callback<OrderResponse> cb) {
            client->newOrder({ "example.com" }, std::move(cb));
        });
        TEST_CHECK(order && *order);
    }

    std::vector<std::string> nonces;
    for (const auto& req : f.transport.requests) {
        if (req.method != Method::Post) {
            continue;
        }
        const auto jws = decodeJws(req.body);
        TEST_REQUIRE(jws);
        nonces.push_back(protectedMember(*jws, "nonce"));
    }
    TEST_REQUIRE(nonces.size() == 3);
    TEST_CHECK(nonces[0] == "nonce-1");
    TEST_CHECK(nonces[1] == "nonce-2");
    TEST_CHECK(nonces[2] == "nonce-3");
}

TEST_CASE("fetchOrder falls back to the requested URL as location")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    const std::string orderUrl = "https://ca/acme/order/1";
    f.transport.reply(Method::Post, orderUrl, makeResponse(StatusCode::Ok, orderJson));
    const auto order = capture<OrderResponse>([&](AcmeClient::Callback<OrderResponse> cb) {
        client->fetchOrder(orderUrl, std::move(cb));
    });
    TEST_REQUIRE(order && *order);
    TEST_CHECK((*order)->location == std::optional<std::string>(orderUrl));
    const auto jws = f.lastJws();
    TEST_REQUIRE(jws);
    TEST_CHECK(jws->payload.empty());
}

TEST_CASE("Transport failure on a signed request is a transport error with context")
{
    Fixture f;
    auto client = f.constructOrNull();
    TEST_REQUIRE(client);
    f.transport.replyError(
        Method::Post, newOrderUrl, std::make_error_code(std::errc::connection_aborted));
    const auto order = capture<OrderResponse>([&](AcmeClient::Callback<OrderResponse> cb) {
        client->newOrder({ "example.com" }, std::move(cb));
    });
    TEST_REQUIRE(order && !*order);
    TEST_CHECK(order->error().kind == AcmeErrorKind::Transport);
    TEST_CHECK(toString(order->error()).find("new order") != std::string::npos);
}
