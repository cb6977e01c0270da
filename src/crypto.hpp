#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "time.hpp"

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

enum class KeyType { Ec, Rsa };

std::string_view toString(KeyType type);
std::optional<KeyType> parseKeyType(std::string_view str);

// EC keys are always P-256. rsaBits is ignored for EC keys.
PkeyPtr generatePrivateKey(KeyType type, size_t rsaBits = 2048);
PkeyPtr parsePrivateKey(std::string_view pem);
PkeyPtr loadPrivateKey(const std::string& path);
std::optional<std::string> privateKeyToPem(EVP_PKEY* pkey);
bool writePrivateKey(EVP_PKEY* pkey, const std::string& path);

// Loads the key at path, or generates and writes a new one if it does not exist
PkeyPtr getPrivateKey(const std::string& path, KeyType type, size_t rsaBits);

// DER encoded CSR with the first domain as CN and all domains as subjectAltName
std::optional<std::string> generateCertificateSigningRequest(
    const std::vector<std::string>& domains, EVP_PKEY* pkey);

// Time until the notAfter of the first certificate in a PEM chain. Zero if it expired already.
std::optional<Duration> getCertValidAfterNow(std::string_view pem);
std::optional<Duration> getCertFileValidAfterNow(const std::string& path);
