#include "test.hpp"

#include <filesystem>

#include <unistd.h>

#include "fakes.hpp"
#include "issuer.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
const std::string directoryUrl = "https://ca/dir";
const std::string nonceUrl = "https://ca/nonce";
const std::string accountUrl = "https://ca/acct/7";
const std::string orderUrl = "https://ca/order/1";
const std::string authzUrl = "https://ca/authz/1";
const std::string challengeUrl = "https://ca/chall/1";
const std::string finalizeUrl = "https://ca/order/1/finalize";
const std::string certUrl = "https://ca/cert/1";
const std::string token = "LoqXcYV8q5ONbJQxbmR7SCTNo3tiAXDfowyjxAjEuX0";
const std::string chain = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";

std::string orderJson(std::string_view status, bool withCertificate = false)
{
    return R"({"status":")" + std::string(status) + R"(","authorizations":[")" + authzUrl
        + R"("],"finalize":")" + finalizeUrl + "\""
        + (withCertificate ? R"(,"certificate":")" + certUrl + "\"" : std::string()) + "}";
}

std::string authzJson(std::string_view status, std::string_view http01Token = token)
{
    return R"({"identifier":{"type":"dns","value":"example.com"},"status":")"
        + std::string(status) + R"(","challenges":[{"type":"dns-01","url":"https://ca/chall/0",)"
        + R"("status":"pending","token":"other"},{"type":"http-01","url":")" + challengeUrl
        + R"(","status":"pending","token":")" + std::string(http01Token) + "\"}]}";
}

struct IssuerFixture {
    FakeTransport transport;
    JwsSigner signer { transport };
    RecordingRecorder recorder;
    fs::path dir;
    Config::Acme config;
    size_t scheduled = 0;

    IssuerFixture(const std::string& name)
        : dir(fs::temp_directory_path()
            / ("whacme-issuer-" + name + "-" + std::to_string(::getpid())))
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
        transport.serveNonces(nonceUrl);

        config.name = "example";
        config.url = directoryUrl;
        config.domains = { "example.com" };
        config.directory = dir.string();
        config.accountKeyPath = (dir / "accountkey.pem").string();
        config.certKeyPath = (dir / "example/privkey.pem").string();
        config.certPath = (dir / "example/fullchain.pem").string();
        config.webroot = (dir / "www").string();
        config.pollAttempts = 3;
    }

    ~IssuerFixture()
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string challengePath() const
    {
        return (dir / "www/.well-known/acme-challenge" / token).string();
    }

    void scriptAccount()
    {
        transport.reply(Method::Get, directoryUrl,
            makeResponse(StatusCode::Ok,
                R"({"newNonce":")" + nonceUrl
                    + R"(","newAccount":"https://ca/new-acct","newOrder":"https://ca/new-order"})"));
        transport.reply(Method::Post, "https://ca/new-acct",
            makeResponse(StatusCode::Ok, "{}", { { "Location", accountUrl } }));
    }

    std::optional<Issuer::Outcome> run(bool force = false)
    {
        std::optional<Issuer::Outcome> outcome;
        auto issuer = Issuer::create(config, transport, signer,
            [this](uint64_t, Function<void()> fn) {
                scheduled++;
                fn();
            },
            recorder);
        issuer->run(force, [&outcome](Issuer::Outcome o) { outcome = o; });
        return outcome;
    }
};
}

TEST_CASE("Issuer runs the whole issuance")
{
    IssuerFixture f("full");
    f.scriptAccount();
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::Created, orderJson("pending"), { { "Location", orderUrl } }));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending")));
    f.transport.reply(Method::Post, challengeUrl, makeResponse(StatusCode::Ok, "{}"));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending")));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("valid")));
    f.transport.reply(Method::Post, finalizeUrl,
        makeResponse(StatusCode::Ok, orderJson("processing")));
    f.transport.reply(Method::Post, orderUrl, makeResponse(StatusCode::Ok, orderJson("valid", true)));
    f.transport.reply(Method::Post, certUrl, makeResponse(StatusCode::Ok, chain));

    std::optional<std::string> servedKeyAuth;
    f.transport.onRequest = [&f, &servedKeyAuth](const FakeTransport::Request& req) {
        if (req.url == challengeUrl) {
            servedKeyAuth = readFile(f.challengePath());
        }
    };

    const auto outcome = f.run();
    TEST_CHECK(outcome == std::optional<Issuer::Outcome>(Issuer::Outcome::Issued));
    TEST_CHECK(readFile(f.config.certPath) == std::optional<std::string>(chain));
    TEST_CHECK(fs::exists(f.config.accountKeyPath));
    TEST_CHECK(fs::exists(f.config.certKeyPath));

    const auto accountKey = KeyPair::create(loadPrivateKey(f.config.accountKeyPath));
    TEST_REQUIRE(accountKey);
    TEST_CHECK(servedKeyAuth == std::optional<std::string>(token + "." + accountKey->thumbprint()));
    TEST_CHECK(!fs::exists(f.challengePath()));
    // Two authorization polls and one order poll
    TEST_CHECK(f.scheduled == 3);
    TEST_CHECK(f.transport.requestsTo(authzUrl).size() == 3);
}

TEST_CASE("Issuer skips a certificate that is still valid")
{
    IssuerFixture f("skip");
    TEST_REQUIRE(prepareDirectories(f.config.certPath));
    TEST_REQUIRE(writeFile(f.config.certPath, makeCertificatePem("example.com", 60)));
    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Skipped));
    TEST_CHECK(f.transport.requests.empty());

    // Forced, but the CA is unreachable
    TEST_CHECK(f.run(true) == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(f.transport.requests.size() == 1);
}

TEST_CASE("Issuer renews a certificate that expires soon")
{
    IssuerFixture f("renew");
    TEST_REQUIRE(prepareDirectories(f.config.certPath));
    TEST_REQUIRE(writeFile(f.config.certPath, makeCertificatePem("example.com", 10)));
    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(f.transport.requestsTo(directoryUrl).size() == 1);
}

TEST_CASE("Issuer retries a step once on badNonce")
{
    IssuerFixture f("badnonce");
    f.scriptAccount();
    const auto badNonce = R"({"type":"urn:ietf:params:acme:error:badNonce","detail":"stale"})";
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::BadRequest, badNonce));
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::BadRequest, badNonce));
    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(f.transport.requestsTo("https://ca/new-order").size() == 2);
}

TEST_CASE("Issuer fails on an invalid authorization and cleans up")
{
    IssuerFixture f("invalid");
    f.scriptAccount();
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::Created, orderJson("pending"), { { "Location", orderUrl } }));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending")));
    f.transport.reply(Method::Post, challengeUrl, makeResponse(StatusCode::Ok, "{}"));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("invalid")));

    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(fs::exists(f.config.accountKeyPath));
    TEST_CHECK(!fs::exists(f.challengePath()));
    TEST_CHECK(!fs::exists(f.config.certPath));
    TEST_CHECK(f.transport.requestsTo(finalizeUrl).empty());
}

TEST_CASE("Issuer gives up after pollAttempts")
{
    IssuerFixture f("attempts");
    f.scriptAccount();
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::Created, orderJson("pending"), { { "Location", orderUrl } }));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending")));
    f.transport.reply(Method::Post, challengeUrl, makeResponse(StatusCode::Ok, "{}"));
    for (uint32_t i = 0; i < f.config.pollAttempts + 1; ++i) {
        f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending")));
    }

    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(f.scheduled == f.config.pollAttempts);
    TEST_CHECK(f.transport.requestsTo(authzUrl).size() == 1 + f.config.pollAttempts);
}

TEST_CASE("Issuer skips authorizations that are valid already")
{
    IssuerFixture f("validauthz");
    f.scriptAccount();
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::Created, orderJson("ready"), { { "Location", orderUrl } }));
    f.transport.reply(Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("valid")));
    f.transport.reply(
        Method::Post, finalizeUrl, makeResponse(StatusCode::Ok, orderJson("valid", true)));
    f.transport.reply(Method::Post, certUrl, makeResponse(StatusCode::Ok, chain));

    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Issued));
    TEST_CHECK(f.transport.requestsTo(challengeUrl).empty());
    TEST_CHECK(f.scheduled == 0);
    TEST_CHECK(readFile(f.config.certPath) == std::optional<std::string>(chain));
}

TEST_CASE("Issuer rejects challenge tokens that leave the webroot")
{
    IssuerFixture f("token");
    f.scriptAccount();
    f.transport.reply(Method::Post, "https://ca/new-order",
        makeResponse(StatusCode::Created, orderJson("pending"), { { "Location", orderUrl } }));
    f.transport.reply(
        Method::Post, authzUrl, makeResponse(StatusCode::Ok, authzJson("pending", "../../x")));

    TEST_CHECK(f.run() == std::optional<Issuer::Outcome>(Issuer::Outcome::Failed));
    TEST_CHECK(!fs::exists(f.dir / "www/x"));
    TEST_CHECK(!fs::exists(f.dir / "x"));
    TEST_CHECK(f.transport.requestsTo(challengeUrl).empty());
}
