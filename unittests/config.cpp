#include "test.hpp"

#include <cstdlib>

#include "config.hpp"

TEST_CASE("Config with defaults")
{
    ::setenv("XDG_DATA_HOME", "/var/lib/data", 1);
    Config config;
    TEST_REQUIRE(config.loadFromString(R"(
acme: {
  example: {
    domains: ["example.com", "www.example.com"]
    webroot: "/var/www/html"
  }
}
)"));
    TEST_CHECK(config.ioQueueSize == 256);
    TEST_CHECK(config.requestTimeout == Duration::fromSeconds(30));
    TEST_REQUIRE(config.acme.count("example") == 1);
    const auto& acme = config.acme.at("example");
    TEST_CHECK(acme.name == "example");
    TEST_CHECK(acme.url == "https://acme-v02.api.letsencrypt.org/directory");
    TEST_CHECK(acme.domains == std::vector<std::string>({ "example.com", "www.example.com" }));
    TEST_CHECK(acme.directory == "/var/lib/data/whacme");
    TEST_CHECK(acme.accountKeyPath == "/var/lib/data/whacme/accountkey.pem");
    TEST_CHECK(acme.certKeyPath == "/var/lib/data/whacme/example/privkey.pem");
    TEST_CHECK(acme.certPath == "/var/lib/data/whacme/example/fullchain.pem");
    TEST_CHECK(acme.keyType == KeyType::Ec);
    TEST_CHECK(acme.renewBeforeExpiry == Duration::fromDays(30));
    TEST_CHECK(acme.pollInterval == Duration::fromSeconds(2));
    TEST_CHECK(acme.pollAttempts == 30);
}

TEST_CASE("Config with everything set")
{
    ::setenv("WHACME_TEST_DIR", "/srv/acme", 1);
    ::unsetenv("WHACME_TEST_UNSET");
    Config config;
    TEST_REQUIRE(config.loadFromString(R"(
io_queue_size: 64
request_timeout: "10s"
acme: {
  staging: {
    url: "letsencrypt-staging"
    domains: ["a.example"]
    directory: "${WHACME_TEST_DIR}"
    account_key_path: "${WHACME_TEST_UNSET:/etc/acct.pem}"
    cert_key_path: "/etc/key.pem"
    cert_path: "/etc/chain.pem"
    key_type: "rsa"
    rsa_key_length: 4096
    webroot: "/var/www"
    renew_before_expiry: "14d"
    poll_interval: "5s"
    poll_attempts: 3
  }
  custom: {
    url: "https://localhost:14000/dir"
    domains: ["b.example"]
    directory: "/tmp/custom"
    webroot: "/var/www"
  }
}
)"));
    TEST_CHECK(config.ioQueueSize == 64);
    TEST_CHECK(config.requestTimeout == Duration::fromSeconds(10));
    TEST_REQUIRE(config.acme.size() == 2);
    const auto& staging = config.acme.at("staging");
    TEST_CHECK(staging.url == "https://acme-staging-v02.api.letsencrypt.org/directory");
    TEST_CHECK(staging.directory == "/srv/acme");
    TEST_CHECK(staging.accountKeyPath == "/etc/acct.pem");
    TEST_CHECK(staging.certKeyPath == "/etc/key.pem");
    TEST_CHECK(staging.certPath == "/etc/chain.pem");
    TEST_CHECK(staging.keyType == KeyType::Rsa);
    TEST_CHECK(staging.rsaKeyLength == 4096);
    TEST_CHECK(staging.renewBeforeExpiry == Duration::fromDays(14));
    TEST_CHECK(staging.pollInterval == Duration::fromSeconds(5));
    TEST_CHECK(staging.pollAttempts == 3);

    const auto& custom = config.acme.at("custom");
    TEST_CHECK(custom.url == "https://localhost:14000/dir");
    TEST_CHECK(custom.certPath == "/tmp/custom/custom/fullchain.pem");
}

TEST_CASE("Invalid configs are rejected")
{
    const std::vector<std::string> invalid = {
        "",
        "acme: {}",
        "unknown: 1",
        R"(acme: { x: { webroot: "/w" } })",
        R"(acme: { x: { domains: [], webroot: "/w" } })",
        R"(acme: { x: { domains: ["a.example"] } })",
        R"(acme: { x: { domains: "a.example", webroot: "/w" } })",
        R"(acme: { x: { domains: ["-bad.example"], webroot: "/w" } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "/w", key_type: "dsa" } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "/w", rsa_key_length: 1000 } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "/w", poll_interval: "soon" } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "/w", poll_attempts: 0 } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "/w", typo: 1 } })",
        R"(io_queue_size: 100
acme: { x: { domains: ["a.example"], webroot: "/w" } })",
        R"(acme: { x: { domains: ["a.example"], webroot: "${WHACME_TEST_UNDEFINED}" } })",
    };
    ::unsetenv("WHACME_TEST_UNDEFINED");
    for (const auto& source : invalid) {
        Config config;
        const auto loaded = config.loadFromString(source);
        if (loaded) {
            std::cerr << "Accepted: " << source << "\n";
        }
        TEST_CHECK(!loaded);
    }
}

TEST_CASE("Failed load keeps the previous config")
{
    Config config;
    TEST_REQUIRE(config.loadFromString(R"(acme: { x: { domains: ["a.example"], webroot: "/w" } })"));
    TEST_CHECK(!config.loadFromString(R"(io_queue_size: 3)"));
    TEST_CHECK(config.acme.count("x") == 1);
}

TEST_CASE("isValidDomainName")
{
    TEST_CHECK(isValidDomainName("example.com"));
    TEST_CHECK(isValidDomainName("123.example-host.com"));
    TEST_CHECK(isValidDomainName("localhost"));
    TEST_CHECK(!isValidDomainName(""));
    TEST_CHECK(!isValidDomainName("example..com"));
    TEST_CHECK(!isValidDomainName("example.com."));
    TEST_CHECK(!isValidDomainName("exa_mple.com"));
    TEST_CHECK(!isValidDomainName("example-.com"));
    TEST_CHECK(!isValidDomainName(std::string(64, 'a') + ".com"));
    TEST_CHECK(!isValidDomainName("*.example.com"));
}
