#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <minijson.hpp>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "base64.hpp"
#include "crypto.hpp"
#include "log.hpp"
#include "transport.hpp"

// In-memory Transport. Replies are scripted per method and URL and handed out in order.
// Callbacks are called synchronously, before request returns.
class FakeTransport : public Transport {
public:
    struct Request {
        Method method;
        std::string url;
        HeaderMap<> headers;
        std::string body;
    };

    void reply(Method method, std::string url, Response response)
    {
        replies_.push_back({ method, std::move(url), {}, std::move(response) });
    }

    void replyError(Method method, std::string url, std::error_code ec)
    {
        replies_.push_back({ method, std::move(url), ec, Response {} });
    }

    // Every GET to url is answered with 200 and a fresh Replay-Nonce ("nonce-1", "nonce-2", ..)
    void serveNonces(std::string url) { nonceUrl_ = std::move(url); }

    void request(Method method, const std::string& url, const HeaderMap<>& headers,
        const std::string& body, Callback cb) override
    {
        requests.push_back(Request { method, url, headers, body });
        if (onRequest) {
            onRequest(requests.back());
        }
        if (nonceUrl_ && method == Method::Get && url == *nonceUrl_) {
            Response resp(StatusCode::Ok);
            resp.headers.add("Replay-Nonce", "nonce-" + std::to_string(++noncesServed));
            cb(std::error_code(), std::move(resp));
            return;
        }
        for (auto it = replies_.begin(); it != replies_.end(); ++it) {
            if (it->method == method && it->url == url) {
                auto reply = std::move(*it);
                replies_.erase(it);
                cb(reply.ec, std::move(reply.response));
                return;
            }
        }
        cb(std::make_error_code(std::errc::connection_refused), Response {});
    }

    std::vector<const Request*> requestsTo(std::string_view url) const
    {
        std::vector<const Request*> ret;
        for (const auto& req : requests) {
            if (req.url == url) {
                ret.push_back(&req);
            }
        }
        return ret;
    }

    std::vector<Request> requests;
    size_t noncesServed = 0;
    std::function<void(const Request&)> onRequest;

private:
    struct Reply {
        Method method;
        std::string url;
        std::error_code ec;
        Response response;
    };

    std::deque<Reply> replies_;
    std::optional<std::string> nonceUrl_;
};

inline Response makeResponse(StatusCode status, std::string body,
    std::vector<std::pair<std::string, std::string>> headers = {})
{
    Response resp(status, std::move(body));
    for (const auto& [name, value] : headers) {
        resp.headers.add(name, value);
    }
    return resp;
}

class RecordingRecorder : public slog::Recorder {
public:
    struct Event {
        std::string name;
        std::vector<std::pair<std::string, std::string>> fields;

        std::optional<std::string> get(std::string_view key) const
        {
            for (const auto& [k, v] : fields) {
                if (k == key) {
                    return v;
                }
            }
            return std::nullopt;
        }
    };

    void record(std::string_view event, const slog::Fields& fields) override
    {
        auto& ev = events.emplace_back();
        ev.name = std::string(event);
        for (const auto& [key, value] : fields) {
            ev.fields.emplace_back(std::string(key), value);
        }
    }

    const Event* find(std::string_view name) const
    {
        for (const auto& ev : events) {
            if (ev.name == name) {
                return &ev;
            }
        }
        return nullptr;
    }

    std::vector<Event> events;
};

struct DecodedJws {
    std::string protectedHeader;
    std::string payload;
    std::string signature;
    std::string signingInput;
};

inline std::optional<DecodedJws> decodeJws(const std::string& body)
{
    auto json = minijson::parse(body);
    if (!json) {
        return std::nullopt;
    }
    const auto& obj = *json;
    if (!obj["protected"].isString() || !obj["payload"].isString()
        || !obj["signature"].isString()) {
        return std::nullopt;
    }
    const auto protectB64 = std::string(obj["protected"].asString());
    const auto payloadB64 = std::string(obj["payload"].asString());
    auto protect = decodeBase64Url(protectB64);
    auto payload = decodeBase64Url(payloadB64);
    auto signature = decodeBase64Url(std::string(obj["signature"].asString()));
    if (!protect || !payload || !signature) {
        return std::nullopt;
    }
    return DecodedJws { std::move(*protect), std::move(*payload), std::move(*signature),
        protectB64 + "." + payloadB64 };
}

// Self-signed PEM certificate for domain that expires in validDays
inline std::string makeCertificatePem(const std::string& domain, long validDays)
{
    const auto pkey = generatePrivateKey(KeyType::Ec);
    auto cert = std::unique_ptr<X509, decltype(&X509_free)>(X509_new(), X509_free);
    if (!pkey || !cert) {
        return "";
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), validDays * 24 * 60 * 60);
    X509_set_pubkey(cert.get(), pkey.get());
    const auto name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(domain.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (!X509_sign(cert.get(), pkey.get(), EVP_sha256())) {
        return "";
    }

    auto bio = std::unique_ptr<BIO, decltype(&BIO_free)>(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_X509(bio.get(), cert.get());
    char* data = nullptr;
    const auto len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}
