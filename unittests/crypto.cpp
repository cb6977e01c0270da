#include "test.hpp"

#include <filesystem>

#include <unistd.h>

#include <openssl/x509v3.h>

#include "challenge.hpp"
#include "crypto.hpp"
#include "fakes.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
std::vector<std::string> getDnsNames(X509_REQ* req)
{
    std::vector<std::string> names;
    auto exts = X509_REQ_get_extensions(req);
    if (!exts) {
        return names;
    }
    auto sans = static_cast<GENERAL_NAMES*>(
        X509V3_get_d2i(exts, NID_subject_alt_name, nullptr, nullptr));
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    if (!sans) {
        return names;
    }
    for (int i = 0; i < sk_GENERAL_NAME_num(sans); ++i) {
        const auto name = sk_GENERAL_NAME_value(sans, i);
        if (name->type == GEN_DNS) {
            const auto str = name->d.dNSName;
            names.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(str)),
                static_cast<size_t>(ASN1_STRING_length(str)));
        }
    }
    GENERAL_NAMES_free(sans);
    return names;
}

std::string tempPath(const std::string& name)
{
    return (fs::temp_directory_path() / ("whacme-test-" + std::to_string(::getpid())) / name)
        .string();
}
}

TEST_CASE("CSR has CN and all domains as SAN")
{
    const auto pkey = generatePrivateKey(KeyType::Ec);
    TEST_REQUIRE(pkey);
    const std::vector<std::string> domains = { "example.com", "www.example.com" };
    const auto der = generateCertificateSigningRequest(domains, pkey.get());
    TEST_REQUIRE(der);

    auto derPtr = reinterpret_cast<const unsigned char*>(der->data());
    auto req = std::unique_ptr<X509_REQ, decltype(&X509_REQ_free)>(
        d2i_X509_REQ(nullptr, &derPtr, static_cast<long>(der->size())), X509_REQ_free);
    TEST_REQUIRE(req);
    TEST_CHECK(X509_REQ_verify(req.get(), pkey.get()) == 1);

    char cn[256] = {};
    X509_NAME_get_text_by_NID(X509_REQ_get_subject_name(req.get()), NID_commonName, cn, sizeof(cn));
    TEST_CHECK(std::string(cn) == "example.com");
    TEST_CHECK(getDnsNames(req.get()) == domains);
}

TEST_CASE("CSR needs domains")
{
    const auto pkey = generatePrivateKey(KeyType::Rsa, 2048);
    TEST_REQUIRE(pkey);
    TEST_CHECK(!generateCertificateSigningRequest({}, pkey.get()));
}

TEST_CASE("getCertValidAfterNow")
{
    const auto valid = getCertValidAfterNow(makeCertificatePem("example.com", 90));
    TEST_REQUIRE(valid);
    TEST_CHECK(Duration::fromDays(89) < *valid);
    TEST_CHECK(!(Duration::fromDays(90) < *valid));

    const auto expired = getCertValidAfterNow(makeCertificatePem("example.com", -2));
    TEST_REQUIRE(expired);
    TEST_CHECK(expired->toSeconds() == 0);

    TEST_CHECK(!getCertValidAfterNow("garbage"));
}

TEST_CASE("getPrivateKey generates once and loads afterwards")
{
    const auto path = tempPath("keys/account.pem");
    std::error_code ec;
    fs::remove(path, ec);

    const auto generated = getPrivateKey(path, KeyType::Ec, 2048);
    TEST_REQUIRE(generated);
    TEST_CHECK(fs::is_regular_file(path));
    const auto perms = fs::status(path).permissions();
    TEST_CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);

    const auto loaded = getPrivateKey(path, KeyType::Rsa, 2048);
    TEST_REQUIRE(loaded);
    // The existing key wins over the requested type
    TEST_CHECK(EVP_PKEY_base_id(loaded.get()) == EVP_PKEY_EC);
    TEST_CHECK(privateKeyToPem(generated.get()) == privateKeyToPem(loaded.get()));

    fs::remove_all(fs::path(path).parent_path().parent_path(), ec);
}

TEST_CASE("parseKeyType")
{
    TEST_CHECK(parseKeyType("ec") == std::optional<KeyType>(KeyType::Ec));
    TEST_CHECK(parseKeyType("rsa") == std::optional<KeyType>(KeyType::Rsa));
    TEST_CHECK(!parseKeyType("dsa"));
}

TEST_CASE("Challenge helpers")
{
    const auto key = KeyPair::generate(KeyType::Ec);
    TEST_REQUIRE(key);
    const auto keyAuth = keyAuthorization("evaGxfADs6pSRb2LAv9IZf17Dt3juxGJ-PCt92wr-oA", *key);
    TEST_CHECK(keyAuth == "evaGxfADs6pSRb2LAv9IZf17Dt3juxGJ-PCt92wr-oA." + key->thumbprint());
    TEST_CHECK(http01Path("tok") == std::optional<std::string>("/.well-known/acme-challenge/tok"));
    TEST_CHECK(http01Path("evaGxfADs6pSRb2LAv9IZf17Dt3juxGJ-PCt92wr-oA"));
    TEST_CHECK(!http01Path(""));
    TEST_CHECK(!http01Path("../../x"));
    TEST_CHECK(!http01Path("a/b"));
    TEST_CHECK(!http01Path("tok="));
    TEST_CHECK(!http01Path(".."));
    TEST_CHECK(dns01RecordName("*.example.org") == "_acme-challenge.example.org");
    TEST_CHECK(dns01RecordName("www.example.org") == "_acme-challenge.www.example.org");
    TEST_CHECK(dns01TxtValue(keyAuth) == encodeBase64Url(sha256(keyAuth)));
    TEST_CHECK(dns01TxtValue(keyAuth).size() == 43);

    AuthorizationResponse authz;
    authz.challenges.push_back(Challenge { "dns-01", "https://ca/c/1" });
    authz.challenges.push_back(Challenge { "http-01", "https://ca/c/2" });
    const auto http = findChallenge(authz, "http-01");
    TEST_REQUIRE(http);
    TEST_CHECK(http->url == "https://ca/c/2");
    TEST_CHECK(!findChallenge(authz, "tls-alpn-01"));
}

TEST_CASE("writeFile replaces the file")
{
    const auto path = tempPath("file.txt");
    TEST_REQUIRE(prepareDirectories(path));
    TEST_REQUIRE(writeFile(path, "first"));
    TEST_REQUIRE(writeFile(path, "second"));
    TEST_CHECK(readFile(path) == std::optional<std::string>("second"));
    std::error_code ec;
    fs::remove_all(fs::path(path).parent_path(), ec);
    TEST_CHECK(!readFile(path));
}
