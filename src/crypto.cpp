#include "crypto.hpp"

#include <filesystem>

#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include "log.hpp"
#include "ssl.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
template <typename T, typename F>
auto makeUnique(T* ptr, F deleter)
{
    return std::unique_ptr<T, F>(ptr, deleter);
}

PkeyPtr makePkeyPtr(EVP_PKEY* ptr)
{
    return PkeyPtr(ptr, EVP_PKEY_free);
}

#define CHECK_OR_NULLOPT(cond, ...)                                                                \
    if (!(cond)) {                                                                                 \
        slog::error(__VA_ARGS__);                                                                  \
        return std::nullopt;                                                                       \
    }
}

std::string_view toString(KeyType type)
{
    switch (type) {
    case KeyType::Ec:
        return "ec";
    case KeyType::Rsa:
        return "rsa";
    default:
        return "unknown";
    }
}

std::optional<KeyType> parseKeyType(std::string_view str)
{
    if (str == "ec") {
        return KeyType::Ec;
    } else if (str == "rsa") {
        return KeyType::Rsa;
    }
    return std::nullopt;
}

PkeyPtr generatePrivateKey(KeyType type, size_t rsaBits)
{
    auto ctx = makeUnique(
        EVP_PKEY_CTX_new_id(type == KeyType::Ec ? EVP_PKEY_EC : EVP_PKEY_RSA, nullptr),
        EVP_PKEY_CTX_free);
    if (!ctx) {
        return makePkeyPtr(nullptr);
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return makePkeyPtr(nullptr);
    }

    if (type == KeyType::Ec) {
        if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
            return makePkeyPtr(nullptr);
        }
        // Write the curve name instead of explicit parameters to PEM files
        if (EVP_PKEY_CTX_set_ec_param_enc(ctx.get(), OPENSSL_EC_NAMED_CURVE) <= 0) {
            return makePkeyPtr(nullptr);
        }
    } else {
        if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(rsaBits)) <= 0) {
            return makePkeyPtr(nullptr);
        }
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0) {
        return makePkeyPtr(nullptr);
    }
    return makePkeyPtr(pkey);
}

PkeyPtr parsePrivateKey(std::string_view pem)
{
    auto bio = makeUnique(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        return makePkeyPtr(nullptr);
    }
    return makePkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

PkeyPtr loadPrivateKey(const std::string& path)
{
    const auto pem = readFile(path);
    if (!pem) {
        return makePkeyPtr(nullptr);
    }
    return parsePrivateKey(*pem);
}

std::optional<std::string> privateKeyToPem(EVP_PKEY* pkey)
{
    auto bio = makeUnique(BIO_new(BIO_s_mem()), BIO_free);
    CHECK_OR_NULLOPT(bio, "BIO_new: ", getSslErrorString());
    const auto res
        = PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr);
    CHECK_OR_NULLOPT(res, "PEM_write_bio_PrivateKey: ", getSslErrorString());
    char* data = nullptr;
    const auto size = BIO_get_mem_data(bio.get(), &data);
    CHECK_OR_NULLOPT(size > 0, "BIO_get_mem_data: ", getSslErrorString());
    return std::string(data, static_cast<size_t>(size));
}

bool writePrivateKey(EVP_PKEY* pkey, const std::string& path)
{
    const auto pem = privateKeyToPem(pkey);
    if (!pem) {
        return false;
    }
    return writeFile(path, *pem, true);
}

PkeyPtr getPrivateKey(const std::string& path, KeyType type, size_t rsaBits)
{
    if (fs::exists(path)) {
        auto pkey = loadPrivateKey(path);
        if (!pkey) {
            slog::error("Could not load private key from '", path, "': ", getSslErrorString());
            return makePkeyPtr(nullptr);
        }
        return pkey;
    }

    slog::info("Generating ", toString(type), " private key '", path, "'");
    auto pkey = generatePrivateKey(type, rsaBits);
    if (!pkey) {
        slog::error("Could not generate private key: ", getSslErrorString());
        return makePkeyPtr(nullptr);
    }

    if (!prepareDirectories(path) || !writePrivateKey(pkey.get(), path)) {
        slog::error("Could not write private key to '", path, "'");
        return makePkeyPtr(nullptr);
    }

    return pkey;
}

std::optional<std::string> generateCertificateSigningRequest(
    const std::vector<std::string>& domains, EVP_PKEY* pkey)
{
    CHECK_OR_NULLOPT(!domains.empty(), "Can't create a CSR without domains");

    auto req = makeUnique(X509_REQ_new(), X509_REQ_free);
    CHECK_OR_NULLOPT(req, "X509_REQ_new: ", getSslErrorString());
    auto name = makeUnique(X509_NAME_new(), X509_NAME_free);
    CHECK_OR_NULLOPT(name, "X509_NAME_new: ", getSslErrorString());
    const auto& cn = domains.front();
    auto res = X509_NAME_add_entry_by_txt(name.get(), "CN", MBSTRING_ASC,
        reinterpret_cast<const uint8_t*>(cn.data()), static_cast<int>(cn.size()), -1, 0);
    CHECK_OR_NULLOPT(res, "X509_NAME_add_entry_by_txt: ", getSslErrorString());
    res = X509_REQ_set_subject_name(req.get(), name.get());
    CHECK_OR_NULLOPT(res, "X509_REQ_set_subject_name: ", getSslErrorString());

    std::string san;
    for (const auto& domain : domains) {
        if (!san.empty()) {
            san += ",";
        }
        san += "DNS:" + domain;
    }

    using Exts = STACK_OF(X509_EXTENSION);
    auto extsDeleter = [](Exts* exts) { sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free); };
    auto exts = std::unique_ptr<Exts, void (*)(Exts*)>(sk_X509_EXTENSION_new_null(), extsDeleter);
    CHECK_OR_NULLOPT(exts, "sk_X509_EXTENSION_new_null: ", getSslErrorString());

    auto ext = X509V3_EXT_conf_nid(nullptr, nullptr, NID_subject_alt_name, san.c_str());
    CHECK_OR_NULLOPT(ext, "X509V3_EXT_conf_nid: ", getSslErrorString());
    if (!sk_X509_EXTENSION_push(exts.get(), ext)) {
        X509_EXTENSION_free(ext);
        slog::error("sk_X509_EXTENSION_push: ", getSslErrorString());
        return std::nullopt;
    }
    res = X509_REQ_add_extensions(req.get(), exts.get());
    CHECK_OR_NULLOPT(res, "X509_REQ_add_extensions: ", getSslErrorString());

    res = X509_REQ_set_pubkey(req.get(), pkey);
    CHECK_OR_NULLOPT(res, "X509_REQ_set_pubkey: ", getSslErrorString());
    res = X509_REQ_sign(req.get(), pkey, EVP_sha256());
    CHECK_OR_NULLOPT(res, "X509_REQ_sign: ", getSslErrorString());

    std::string der;
    const auto derSize = i2d_X509_REQ(req.get(), nullptr);
    CHECK_OR_NULLOPT(derSize > 0, "i2d_X509_REQ: ", getSslErrorString());
    der.resize(static_cast<size_t>(derSize));
    auto derPtr = reinterpret_cast<uint8_t*>(der.data());
    const auto size = i2d_X509_REQ(req.get(), &derPtr);
    CHECK_OR_NULLOPT(size == derSize, "i2d_X509_REQ: ", getSslErrorString());

    return der;
}

std::optional<Duration> getCertValidAfterNow(std::string_view pem)
{
    auto bio = makeUnique(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    CHECK_OR_NULLOPT(bio, "BIO_new_mem_buf: ", getSslErrorString());
    // Chains are ordered leaf first, so the first certificate is ours
    auto cert = makeUnique(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free);
    CHECK_OR_NULLOPT(cert, "Could not load certificate: ", getSslErrorString());

    const auto tm = X509_get0_notAfter(cert.get());
    CHECK_OR_NULLOPT(
        tm, "Could not retrieve the notAfter field of the certificate: ", getSslErrorString());

    int days = 0;
    int secs = 0;
    if (!ASN1_TIME_diff(&days, &secs, nullptr, tm)) {
        slog::error("Could not calculate time difference: ", getSslErrorString());
        return std::nullopt;
    }
    if (days < 0 || secs < 0) {
        return Duration {};
    }
    return Duration { static_cast<uint32_t>(days), 0, 0, static_cast<uint32_t>(secs) }
        .normalized();
}

std::optional<Duration> getCertFileValidAfterNow(const std::string& path)
{
    const auto pem = readFile(path);
    if (!pem) {
        return std::nullopt;
    }
    return getCertValidAfterNow(*pem);
}
