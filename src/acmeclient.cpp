#include "acmeclient.hpp"

#include "metrics.hpp"

namespace {
AcmeError withContext(AcmeError&& err, std::string_view context)
{
    err.withContext(context);
    return std::move(err);
}

Result<OrderResponse, AcmeError> decodeOrder(const Response& response)
{
    auto order = decodeJson<OrderResponse>(response);
    if (order) {
        const auto location = response.headers.get("Location");
        if (location) {
            order->location = std::string(*location);
        }
    }
    return order;
}
}

void DirectoryResolver::fetch(
    Transport& transport, const std::string& url, slog::Recorder& recorder, Callback cb)
{
    recorder.record("loading directory", { { "url", url } });
    transport.request(Method::Get, url, {}, "",
        [&recorder, url, cb = std::move(cb)](std::error_code ec, Response&& resp) {
            if (ec) {
                cb(error(AcmeError::transport("failed to load directory " + url, ec)));
                return;
            }
            if (!isSuccess(resp.status)) {
                cb(error(AcmeError::protocol("failed to load directory " + url, resp)));
                return;
            }
            auto directory = decodeJson<Directory>(resp);
            if (!directory) {
                cb(error(withContext(std::move(directory.error()), "failed to load directory")));
                return;
            }
            recorder.record("directory loaded",
                { { "new_nonce", directory->newNonce }, { "new_account", directory->newAccount },
                    { "new_order", directory->newOrder } });
            cb(std::move(directory));
        });
}

void NonceSource::fetch(
    Transport& transport, const Directory& directory, slog::Recorder& recorder, Callback cb)
{
    recorder.record("creating nonce", {});
    transport.request(Method::Get, directory.newNonce, {}, "",
        [&recorder, cb = std::move(cb)](std::error_code ec, Response&& resp) {
            if (ec) {
                cb(error(AcmeError::transport("failed to get nonce", ec)));
                return;
            }
            if (!isSuccess(resp.status)) {
                cb(error(AcmeError::protocol("failed to get nonce", resp)));
                return;
            }
            Metrics::get().noncesFetched.labels().inc();
            // A missing header is not an error here. The CA will reject the request with badNonce.
            auto nonce = std::string(resp.headers.get("Replay-Nonce").value_or(""));
            recorder.record("nonce created", { { "nonce", nonce } });
            cb(std::move(nonce));
        });
}

void AccountRegistrar::registerAccount(Transport& transport, RequestSigner& signer,
    const Directory& directory, std::shared_ptr<const KeyPair> key, slog::Recorder& recorder,
    Callback cb)
{
    recorder.record("creating account", {});
    NonceSource::fetch(transport, directory, recorder,
        [&signer, &recorder, url = directory.newAccount, key = std::move(key), cb = std::move(cb)](
            Result<std::string, AcmeError>&& nonce) mutable {
            if (!nonce) {
                cb(error(withContext(std::move(nonce.error()), "failed to create account")));
                return;
            }
            // Without a kid, so the JWK goes into the protected header
            const SignedRequest request { std::move(key), std::nullopt, std::move(*nonce), url,
                JwsPayload::json(newAccountPayload()) };
            signer.signAndSend(request,
                [&recorder, cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
                    if (!resp) {
                        cb(error(withContext(std::move(resp.error()), "failed to create account")));
                        return;
                    }
                    // 201 for a new account, 200 for an existing one. Both have Location.
                    const auto location = resp->headers.get("Location");
                    if (!location) {
                        auto err = AcmeError::protocol("unable to get account id");
                        err.status = resp->status;
                        cb(error(std::move(err)));
                        return;
                    }
                    auto kid = std::string(*location);
                    recorder.record("account created", { { "kid", kid } });
                    cb(std::move(kid));
                });
        });
}

void AcmeClient::create(Transport& transport, RequestSigner& signer,
    const std::string& directoryUrl, std::shared_ptr<const KeyPair> key,
    Callback<std::shared_ptr<AcmeClient>> cb, slog::Recorder& recorder)
{
    if (!key) {
        cb(error(AcmeError::signing("no account key")));
        return;
    }
    DirectoryResolver::fetch(transport, directoryUrl, recorder,
        [&transport, &signer, &recorder, key = std::move(key), cb = std::move(cb)](
            Result<Directory, AcmeError>&& directory) mutable {
            if (!directory) {
                cb(error(std::move(directory.error())));
                return;
            }
            // Moved into the client once the account exists
            auto dir = std::make_shared<Directory>(std::move(*directory));
            AccountRegistrar::registerAccount(transport, signer, *dir, key, recorder,
                [&transport, &signer, &recorder, dir, key, cb = std::move(cb)](
                    Result<std::string, AcmeError>&& kid) mutable {
                    if (!kid) {
                        cb(error(std::move(kid.error())));
                        return;
                    }
                    cb(std::shared_ptr<AcmeClient>(new AcmeClient(transport, signer, recorder,
                        std::move(*dir), std::move(key), std::move(*kid))));
                });
        });
}

AcmeClient::AcmeClient(Transport& transport, RequestSigner& signer, slog::Recorder& recorder,
    Directory directory, std::shared_ptr<const KeyPair> key, std::string kid)
    : transport_(transport)
    , signer_(signer)
    , recorder_(recorder)
    , directory_(std::move(directory))
    , key_(std::move(key))
    , kid_(std::move(kid))
{
}

template <typename T>
AcmeClient::Callback<T> AcmeClient::instrument(std::string_view op, Callback<T> cb)
{
    Metrics::get().acmeRequests.labels(std::string(op)).inc();
    return [op = std::string(op), start = cpprom::now(), cb = std::move(cb)](
               Result<T, AcmeError>&& res) {
        Metrics::get().acmeRequestDuration.labels(op).observe(cpprom::now() - start);
        if (!res) {
            res.error().withContext(op);
            Metrics::get().acmeErrors.labels(op, std::string(toString(res.error().kind))).inc();
        }
        cb(std::move(res));
    };
}

const Directory& AcmeClient::directory() const
{
    return directory_;
}

const std::string& AcmeClient::accountId() const
{
    return kid_;
}

const std::shared_ptr<const KeyPair>& AcmeClient::keyPair() const
{
    return key_;
}

void AcmeClient::newOrder(const std::vector<std::string>& domains, Callback<OrderResponse> cb)
{
    cb = instrument("new order", std::move(cb));
    if (domains.empty()) {
        cb(error(AcmeError::protocol("no domains")));
        return;
    }
    recorder_.record("new order request", { { "kid", kid_ } });
    signedRequest(directory_.newOrder, JwsPayload::json(newOrderPayload(domains)),
        [self = shared_from_this(), cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            auto order = decodeOrder(*resp);
            if (order) {
                self->recorder_.record(
                    "order created", { { "status", std::string(toString(order->status)) } });
            }
            cb(std::move(order));
        });
}

void AcmeClient::fetchAuthorization(const std::string& authUrl, Callback<AuthorizationResponse> cb)
{
    cb = instrument("fetch authorization", std::move(cb));
    recorder_.record("fetch authorization", { { "auth_url", authUrl } });
    signedRequest(authUrl, JwsPayload::postAsGet(),
        [self = shared_from_this(), cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            auto authz = decodeJson<AuthorizationResponse>(*resp);
            if (authz) {
                self->recorder_.record("authorization response",
                    { { "identifier", authz->identifier.type + ":" + authz->identifier.value },
                        { "status", std::string(toString(authz->status)) } });
            }
            cb(std::move(authz));
        });
}

void AcmeClient::triggerChallenge(
    const std::string& domain, const std::string& challengeUrl, Callback<void> cb)
{
    cb = instrument("trigger challenge", std::move(cb));
    recorder_.record("trigger challenge", { { "auth_uri", challengeUrl }, { "domain", domain } });
    signedRequest(challengeUrl, JwsPayload::json("{}"),
        [cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            cb(Result<void, AcmeError>());
        });
}

void AcmeClient::submitCsr(
    const std::string& finalizeUrl, std::string_view csrDer, Callback<OrderResponse> cb)
{
    cb = instrument("submit csr", std::move(cb));
    recorder_.record("send certificate request", { { "url", finalizeUrl } });
    signedRequest(finalizeUrl, JwsPayload::json(finalizePayload(csrDer)),
        [cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            cb(decodeOrder(*resp));
        });
}

void AcmeClient::downloadCertificate(const std::string& certificateUrl, Callback<std::string> cb)
{
    cb = instrument("download certificate", std::move(cb));
    recorder_.record("download certificate", { { "url", certificateUrl } });
    signedRequest(certificateUrl, JwsPayload::postAsGet(),
        [cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            cb(std::move(resp->body));
        });
}

void AcmeClient::fetchOrder(const std::string& orderUrl, Callback<OrderResponse> cb)
{
    cb = instrument("fetch order", std::move(cb));
    recorder_.record("fetch order", { { "url", orderUrl } });
    signedRequest(orderUrl, JwsPayload::postAsGet(),
        [orderUrl, cb = std::move(cb)](Result<Response, AcmeError>&& resp) {
            if (!resp) {
                cb(error(std::move(resp.error())));
                return;
            }
            auto order = decodeOrder(*resp);
            if (order && !order->location) {
                order->location = orderUrl;
            }
            cb(std::move(order));
        });
}

void AcmeClient::signedRequest(
    const std::string& url, JwsPayload payload, RequestSigner::Callback cb)
{
    NonceSource::fetch(transport_, directory_, recorder_,
        [self = shared_from_this(), url, payload = std::move(payload), cb = std::move(cb)](
            Result<std::string, AcmeError>&& nonce) mutable {
            if (!nonce) {
                cb(error(std::move(nonce.error())));
                return;
            }
            const SignedRequest request { self->key_, self->kid_, std::move(*nonce), url,
                std::move(payload) };
            self->signer_.signAndSend(request, std::move(cb));
        });
}
