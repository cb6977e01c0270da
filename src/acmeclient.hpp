#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "acmeerror.hpp"
#include "acmeprotocol.hpp"
#include "function.hpp"
#include "jose.hpp"
#include "log.hpp"
#include "result.hpp"
#include "transport.hpp"

// ACME client (RFC 8555) that drives the signed request sequence against a CA.
// Every operation is asynchronous: it calls its callback exactly once, from the thread that runs
// the transport. Transport and RequestSigner must outlive the client and all pending operations.
//
// Every signed request uses a nonce that was fetched for it and only for it, right before
// signing. Nothing is retried, so a caller that gets a badNonce error (AcmeError::isBadNonce) can
// simply call the operation again.

struct DirectoryResolver {
    using Callback = Function<void(Result<Directory, AcmeError>&&)>;

    static void fetch(
        Transport& transport, const std::string& url, slog::Recorder& recorder, Callback cb);
};

struct NonceSource {
    using Callback = Function<void(Result<std::string, AcmeError>&&)>;

    // If the response has no Replay-Nonce header, the nonce is the empty string
    static void fetch(
        Transport& transport, const Directory& directory, slog::Recorder& recorder, Callback cb);
};

struct AccountRegistrar {
    // Receives the account URL (kid)
    using Callback = Function<void(Result<std::string, AcmeError>&&)>;

    // Creates an account or finds the existing account for the key
    static void registerAccount(Transport& transport, RequestSigner& signer,
        const Directory& directory, std::shared_ptr<const KeyPair> key, slog::Recorder& recorder,
        Callback cb);
};

class AcmeClient : public std::enable_shared_from_this<AcmeClient> {
public:
    template <typename T>
    using Callback = Function<void(Result<T, AcmeError>&&)>;

    // Loads the directory and registers the account. No client is created if either fails.
    static void create(Transport& transport, RequestSigner& signer, const std::string& directoryUrl,
        std::shared_ptr<const KeyPair> key, Callback<std::shared_ptr<AcmeClient>> cb,
        slog::Recorder& recorder = slog::LogRecorder::getDefault());

    const Directory& directory() const;
    const std::string& accountId() const;
    const std::shared_ptr<const KeyPair>& keyPair() const;

    // One "dns" identifier per domain, in the given order, duplicates included
    void newOrder(const std::vector<std::string>& domains, Callback<OrderResponse> cb);

    void fetchAuthorization(const std::string& authUrl, Callback<AuthorizationResponse> cb);

    // Tells the CA to start validating the challenge. domain is only used for diagnostics.
    void triggerChallenge(
        const std::string& domain, const std::string& challengeUrl, Callback<void> cb);

    // csrDer is the DER encoded CSR
    void submitCsr(const std::string& finalizeUrl, std::string_view csrDer,
        Callback<OrderResponse> cb);

    // The response body (a PEM certificate chain) unchanged. Can be called any number of times.
    void downloadCertificate(const std::string& certificateUrl, Callback<std::string> cb);

    void fetchOrder(const std::string& orderUrl, Callback<OrderResponse> cb);

private:
    AcmeClient(Transport& transport, RequestSigner& signer, slog::Recorder& recorder,
        Directory directory, std::shared_ptr<const KeyPair> key, std::string kid);

    // Draws a fresh nonce and sends one signed request with it
    void signedRequest(const std::string& url, JwsPayload payload, RequestSigner::Callback cb);

    template <typename T>
    Callback<T> instrument(std::string_view op, Callback<T> cb);

    Transport& transport_;
    RequestSigner& signer_;
    slog::Recorder& recorder_;
    const Directory directory_;
    const std::shared_ptr<const KeyPair> key_;
    const std::string kid_;
};
