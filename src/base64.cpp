#include "base64.hpp"

#include <memory>

#include <openssl/bio.h>
#include <openssl/evp.h>

std::string encodeBase64(const std::byte* data, size_t size)
{
    if (size == 0) {
        return "";
    }

    auto base64 = std::unique_ptr<BIO, decltype(&BIO_free_all)>(
        BIO_new(BIO_f_base64()), &BIO_free_all);
    auto out = BIO_new(BIO_s_mem());
    if (!base64 || !out) {
        BIO_free(out);
        return "";
    }
    // Don't insert newlines every 64 characters (like PEM files)
    BIO_set_flags(base64.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO_push(base64.get(), out);

    if (BIO_write(base64.get(), data, static_cast<int>(size)) != static_cast<int>(size)
        || BIO_flush(base64.get()) != 1) {
        return "";
    }

    std::string ret(BIO_pending(out), '\0');
    const auto read = BIO_read(out, ret.data(), static_cast<int>(ret.size()));
    ret.resize(read > 0 ? static_cast<size_t>(read) : 0);
    return ret;
}

std::string encodeBase64Url(const std::byte* data, size_t size)
{
    auto base64 = encodeBase64(data, size);

    const auto end = base64.find_last_not_of('=');
    base64.resize(end == std::string::npos ? 0 : end + 1);

    for (auto& ch : base64) {
        if (ch == '+') {
            ch = '-';
        } else if (ch == '/') {
            ch = '_';
        }
    }

    return base64;
}

std::string encodeBase64Url(std::string_view data)
{
    return encodeBase64Url(reinterpret_cast<const std::byte*>(data.data()), data.size());
}

std::optional<std::string> decodeBase64Url(std::string_view str)
{
    if (str.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string base64;
    base64.reserve(str.size() + 3);
    for (const auto ch : str) {
        if (ch == '-') {
            base64.push_back('+');
        } else if (ch == '_') {
            base64.push_back('/');
        } else if (ch == '+' || ch == '/' || ch == '=') {
            return std::nullopt;
        } else {
            base64.push_back(ch);
        }
    }
    const auto padding = (4 - base64.size() % 4) % 4;
    base64.append(padding, '=');

    std::string ret(base64.size() / 4 * 3, '\0');
    const auto len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(ret.data()),
        reinterpret_cast<const unsigned char*>(base64.data()), static_cast<int>(base64.size()));
    if (len < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock does not strip the bytes produced by padding
    ret.resize(static_cast<size_t>(len) - padding);
    return ret;
}

std::string sha256(std::string_view data)
{
    std::string hash(EVP_MAX_MD_SIZE, '\0');
    unsigned int hashSize = static_cast<unsigned int>(hash.size());
    const auto res = EVP_Digest(data.data(), data.size(),
        reinterpret_cast<unsigned char*>(hash.data()), &hashSize, EVP_sha256(), nullptr);
    if (res != 1) {
        return "";
    }
    hash.resize(hashSize);
    return hash;
}
