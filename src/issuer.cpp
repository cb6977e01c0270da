#include "issuer.hpp"

#include <filesystem>

#include "challenge.hpp"
#include "crypto.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
// A CA may reject any nonce (e.g. after it rotated its nonce keys), so every step is tried a
// second time if it failed with badNonce. The step draws a new nonce when it is invoked again.
template <typename T>
void retryBadNonce(
    Function<void(AcmeClient::Callback<T>)> step, AcmeClient::Callback<T> cb)
{
    auto shared = std::make_shared<Function<void(AcmeClient::Callback<T>)>>(std::move(step));
    (*shared)([shared, cb = std::move(cb)](Result<T, AcmeError>&& res) mutable {
        if (!res && res.error().isBadNonce()) {
            slog::warning("ACME: Nonce was rejected, retrying");
            (*shared)(std::move(cb));
            return;
        }
        cb(std::move(res));
    });
}

bool isFinal(AuthorizationStatus status)
{
    return status == AuthorizationStatus::Invalid || status == AuthorizationStatus::Deactivated
        || status == AuthorizationStatus::Expired || status == AuthorizationStatus::Revoked;
}
}

std::string_view toString(Issuer::Outcome outcome)
{
    switch (outcome) {
    case Issuer::Outcome::Issued:
        return "issued";
    case Issuer::Outcome::Skipped:
        return "skipped";
    case Issuer::Outcome::Failed:
        return "failed";
    default:
        return "unknown";
    }
}

std::shared_ptr<Issuer> Issuer::create(Config::Acme config, Transport& transport,
    RequestSigner& signer, Scheduler scheduler, slog::Recorder& recorder)
{
    return std::shared_ptr<Issuer>(
        new Issuer(std::move(config), transport, signer, std::move(scheduler), recorder));
}

Issuer::Issuer(Config::Acme config, Transport& transport, RequestSigner& signer,
    Scheduler scheduler, slog::Recorder& recorder)
    : config_(std::move(config))
    , transport_(transport)
    , signer_(signer)
    , scheduler_(std::move(scheduler))
    , recorder_(recorder)
{
}

bool Issuer::needIssueCertificate() const
{
    if (!fs::exists(config_.certPath)) {
        return true;
    }

    const auto validTime = getCertFileValidAfterNow(config_.certPath);
    if (!validTime) {
        slog::error("ACME: Could not load existing certificate from ", config_.certPath);
        return true;
    }

    if (*validTime < config_.renewBeforeExpiry) {
        slog::info(
            "ACME: Certificate is valid for ", toString(*validTime), ". Reissuing certificate.");
        return true;
    }

    slog::info("ACME: Certificate is still valid for ", toString(*validTime),
        ". Don't reissue certificate.");
    return false;
}

void Issuer::run(bool force, Callback cb)
{
    cb_ = std::move(cb);
    if (!force && !needIssueCertificate()) {
        finish(Outcome::Skipped);
        return;
    }

    accountKey_ = KeyPair::create(
        getPrivateKey(config_.accountKeyPath, config_.keyType, config_.rsaKeyLength));
    if (!accountKey_) {
        slog::error("ACME: Could not get account key ", config_.accountKeyPath);
        finish(Outcome::Failed);
        return;
    }
    createClient();
}

void Issuer::createClient()
{
    slog::info("ACME: Using directory ", config_.url);
    retryBadNonce<std::shared_ptr<AcmeClient>>(
        [self = shared_from_this()](AcmeClient::Callback<std::shared_ptr<AcmeClient>> cb) {
            AcmeClient::create(self->transport_, self->signer_, self->config_.url,
                self->accountKey_, std::move(cb), self->recorder_);
        },
        [self = shared_from_this()](Result<std::shared_ptr<AcmeClient>, AcmeError>&& client) {
            if (!client) {
                self->fail(client.error());
                return;
            }
            self->client_ = std::move(*client);
            slog::info("ACME: Account URL: ", self->client_->accountId());
            self->createOrder();
        });
}

void Issuer::createOrder()
{
    retryBadNonce<OrderResponse>(
        [self = shared_from_this()](AcmeClient::Callback<OrderResponse> cb) {
            self->client_->newOrder(self->config_.domains, std::move(cb));
        },
        [self = shared_from_this()](Result<OrderResponse, AcmeError>&& order) {
            if (!order) {
                self->fail(order.error());
                return;
            }
            self->order_ = std::move(*order);
            slog::info("ACME: Requested new order (status: ", toString(self->order_.status),
                ", authorizations: ", self->order_.authorizations.size(), ")");
            self->processAuthorization(0);
        });
}

void Issuer::processAuthorization(size_t index)
{
    if (index >= order_.authorizations.size()) {
        finalizeOrder();
        return;
    }

    const auto authUrl = order_.authorizations[index];
    retryBadNonce<AuthorizationResponse>(
        [self = shared_from_this(), authUrl](AcmeClient::Callback<AuthorizationResponse> cb) {
            self->client_->fetchAuthorization(authUrl, std::move(cb));
        },
        [self = shared_from_this(), index](Result<AuthorizationResponse, AcmeError>&& authz) {
            if (!authz) {
                self->fail(authz.error());
                return;
            }

            const auto& domain = authz->identifier.value;
            if (authz->status == AuthorizationStatus::Valid) {
                slog::info("ACME: Authorization for ", domain, " is valid already");
                self->processAuthorization(index + 1);
                return;
            }
            if (isFinal(authz->status)) {
                self->fail(AcmeError::protocol(
                    "authorization for " + domain + " is " + std::string(toString(authz->status))));
                return;
            }

            // RFC 8555 Section 7.1.4: "A client should attempt to fulfill one of these
            // challenges". We only do http-01.
            const auto challenge = findChallenge(*authz, "http-01");
            if (!challenge || !challenge->token) {
                self->fail(AcmeError::protocol("no http-01 challenge for " + domain));
                return;
            }

            const auto urlPath = http01Path(*challenge->token);
            if (!urlPath) {
                self->fail(AcmeError::protocol("invalid challenge token for " + domain));
                return;
            }
            const auto path
                = (fs::path(self->config_.webroot) / fs::path(*urlPath).relative_path()).string();
            self->challengeFiles_.push_back(path);
            if (!prepareDirectories(path)
                || !writeFile(path, keyAuthorization(*challenge->token, *self->accountKey_))) {
                slog::error("ACME: Could not write challenge file ", path);
                self->finish(Outcome::Failed);
                return;
            }
            slog::info("ACME: Wrote challenge for ", domain, " to ", path);

            retryBadNonce<void>(
                [self, domain, url = challenge->url](AcmeClient::Callback<void> cb) {
                    self->client_->triggerChallenge(domain, url, std::move(cb));
                },
                [self, index](Result<void, AcmeError>&& res) {
                    if (!res) {
                        self->fail(res.error());
                        return;
                    }
                    slog::info("ACME: Challenge triggered. Waiting for authorization.");
                    self->pollAuthorization(index, 1);
                });
        });
}

void Issuer::pollAuthorization(size_t index, uint32_t attempt)
{
    scheduler_(config_.pollInterval.toMilliseconds(), [self = shared_from_this(), index,
                                                          attempt]() {
        const auto authUrl = self->order_.authorizations[index];
        retryBadNonce<AuthorizationResponse>(
            [self, authUrl](AcmeClient::Callback<AuthorizationResponse> cb) {
                self->client_->fetchAuthorization(authUrl, std::move(cb));
            },
            [self, index, attempt](Result<AuthorizationResponse, AcmeError>&& authz) {
                if (!authz) {
                    self->fail(authz.error());
                    return;
                }
                slog::info("ACME: Checking.. (", attempt, "): ", toString(authz->status));
                if (authz->status == AuthorizationStatus::Valid) {
                    slog::info("ACME: Authorized ", authz->identifier.value);
                    self->processAuthorization(index + 1);
                    return;
                }
                if (isFinal(authz->status)) {
                    std::string msg = "authorization for " + authz->identifier.value + " is "
                        + std::string(toString(authz->status));
                    const auto challenge = findChallenge(*authz, "http-01");
                    if (challenge && challenge->error) {
                        msg += ": " + challenge->error->detail;
                    }
                    self->fail(AcmeError::protocol(msg));
                    return;
                }
                if (attempt >= self->config_.pollAttempts) {
                    slog::error("ACME: Failed after maximum number of retries");
                    self->finish(Outcome::Failed);
                    return;
                }
                self->pollAuthorization(index, attempt + 1);
            });
    });
}

void Issuer::finalizeOrder()
{
    auto certKey = getPrivateKey(config_.certKeyPath, config_.keyType, config_.rsaKeyLength);
    if (!certKey) {
        slog::error("ACME: Could not get certificate key ", config_.certKeyPath);
        finish(Outcome::Failed);
        return;
    }

    const auto csrDer = generateCertificateSigningRequest(config_.domains, certKey.get());
    if (!csrDer) {
        slog::error("ACME: Could not encode CSR");
        finish(Outcome::Failed);
        return;
    }

    slog::info("ACME: Finalize order (sending CSR)");
    retryBadNonce<OrderResponse>(
        [self = shared_from_this(), csr = *csrDer](AcmeClient::Callback<OrderResponse> cb) {
            self->client_->submitCsr(self->order_.finalize, csr, std::move(cb));
        },
        [self = shared_from_this()](Result<OrderResponse, AcmeError>&& order) {
            if (!order) {
                self->fail(order.error());
                return;
            }
            self->waitForOrder(std::move(*order), 1);
        });
}

void Issuer::waitForOrder(OrderResponse&& order, uint32_t attempt)
{
    if (order.status == OrderStatus::Valid && order.certificate) {
        downloadCertificate(*order.certificate);
        return;
    }
    if (order.status == OrderStatus::Invalid) {
        std::string msg = "order is invalid";
        if (order.error) {
            msg += ": " + order.error->detail;
        }
        fail(AcmeError::protocol(msg));
        return;
    }
    if (attempt > config_.pollAttempts) {
        slog::error("ACME: Failed after maximum number of retries");
        finish(Outcome::Failed);
        return;
    }

    // The finalize response is an order object too, but it does not necessarily carry the
    // order URL, so the new order response is the one to go by.
    const auto orderUrl = order_.location ? order_.location : order.location;
    if (!orderUrl) {
        fail(AcmeError::protocol("no order URL to poll"));
        return;
    }

    slog::info("ACME: Waiting for order to complete (status: ", toString(order.status), ")");
    scheduler_(config_.pollInterval.toMilliseconds(),
        [self = shared_from_this(), orderUrl = *orderUrl, attempt]() {
            retryBadNonce<OrderResponse>(
                [self, orderUrl](AcmeClient::Callback<OrderResponse> cb) {
                    self->client_->fetchOrder(orderUrl, std::move(cb));
                },
                [self, attempt](Result<OrderResponse, AcmeError>&& order) {
                    if (!order) {
                        self->fail(order.error());
                        return;
                    }
                    self->waitForOrder(std::move(*order), attempt + 1);
                });
        });
}

void Issuer::downloadCertificate(const std::string& certificateUrl)
{
    retryBadNonce<std::string>(
        [self = shared_from_this(), certificateUrl](AcmeClient::Callback<std::string> cb) {
            self->client_->downloadCertificate(certificateUrl, std::move(cb));
        },
        [self = shared_from_this()](Result<std::string, AcmeError>&& pem) {
            if (!pem) {
                self->fail(pem.error());
                return;
            }
            const auto& path = self->config_.certPath;
            if (!prepareDirectories(path) || !writeFile(path, *pem)) {
                slog::error("ACME: Could not write certificate to ", path);
                self->finish(Outcome::Failed);
                return;
            }
            slog::info("ACME: Certificate written to ", path);
            self->finish(Outcome::Issued);
        });
}

void Issuer::fail(const AcmeError& err)
{
    slog::error("ACME: ", toString(err));
    finish(Outcome::Failed);
}

void Issuer::finish(Outcome outcome)
{
    for (const auto& path : challengeFiles_) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            slog::warning("ACME: Could not remove challenge file ", path, ": ", ec.message());
        }
    }
    challengeFiles_.clear();
    client_.reset();
    if (cb_) {
        auto cb = std::move(cb_);
        cb_ = nullptr;
        cb(outcome);
    }
}
