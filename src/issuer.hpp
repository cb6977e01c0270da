#pragma once

#include <memory>
#include <string>
#include <vector>

#include "acmeclient.hpp"
#include "config.hpp"
#include "function.hpp"

// Drives one certificate from the current state of cert_path to a freshly issued chain:
// account, order, http-01 challenges, finalization, download. Challenge responses are written
// as files below the configured webroot, so some web server has to serve them.
class Issuer : public std::enable_shared_from_this<Issuer> {
public:
    enum class Outcome { Issued, Skipped, Failed };

    using Callback = Function<void(Outcome)>;
    // Calls the function after delayMs. In the CLI this is an IoQueue timeout.
    using Scheduler = Function<void(uint64_t delayMs, Function<void()> fn)>;

    static std::shared_ptr<Issuer> create(Config::Acme config, Transport& transport,
        RequestSigner& signer, Scheduler scheduler,
        slog::Recorder& recorder = slog::LogRecorder::getDefault());

    // Skips issuance if the existing certificate is valid for longer than renewBeforeExpiry,
    // unless force is true.
    void run(bool force, Callback cb);

    // Whether the certificate at certPath has to be (re-)issued
    bool needIssueCertificate() const;

private:
    Issuer(Config::Acme config, Transport& transport, RequestSigner& signer, Scheduler scheduler,
        slog::Recorder& recorder);

    void createClient();
    void createOrder();
    void processAuthorization(size_t index);
    void pollAuthorization(size_t index, uint32_t attempt);
    void finalizeOrder();
    void waitForOrder(OrderResponse&& order, uint32_t attempt);
    void downloadCertificate(const std::string& certificateUrl);
    void fail(const AcmeError& err);
    void finish(Outcome outcome);

    Config::Acme config_;
    Transport& transport_;
    RequestSigner& signer_;
    Scheduler scheduler_;
    slog::Recorder& recorder_;
    Callback cb_;
    std::shared_ptr<const KeyPair> accountKey_;
    std::shared_ptr<AcmeClient> client_;
    OrderResponse order_;
    std::vector<std::string> challengeFiles_;
};

std::string_view toString(Issuer::Outcome outcome);
