#pragma once

#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <openssl/ssl.h>

#include "tcp.hpp"

// Must be at least 1.1.1
static_assert(OPENSSL_VERSION_NUMBER >= 0x10101000L);

// If an error occured, call this or ERR_clear_error() to clear the error queue
std::string getSslErrorString();

std::string sslErrorToString(int sslError);

// Client context that verifies peers against the system trust store
class SslContext {
public:
    static std::shared_ptr<SslContext> createClient();

    SslContext();
    ~SslContext();
    SslContext(const SslContext&) = delete;
    SslContext& operator=(const SslContext&) = delete;

    bool init();

    operator SSL_CTX*();

private:
    SSL_CTX* ctx_;
};

struct OpenSslErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override;
    std::string message(int errorCode) const override;

    static std::error_code makeError(unsigned long err);
};

OpenSslErrorCategory& getOpenSslErrorCategory();

enum class SslOperation { Invalid = 0, Read, Write, Shutdown };
std::string toString(SslOperation op);

// TLS over a TcpConnection. OpenSSL talks to a memory BIO pair and all socket IO goes through the
// IoQueue.
class SslConnection : public TcpConnection {
public:
    SslConnection(IoQueue& io, int fd, uint64_t timeoutMs, std::shared_ptr<SslContext> context);
    ~SslConnection();

    // Not movable or copyable, because pointers to it are captured in lambdas
    SslConnection(SslConnection&&) = delete;
    SslConnection(const SslConnection&) = delete;
    SslConnection& operator=(const SslConnection&) = delete;
    SslConnection& operator=(SslConnection&&) = delete;

    bool valid() const;

    // Enables SNI and hostname validation of the peer certificate
    bool setHostname(const std::string& hostname);

    // If a handler of any of these three functions comes back with an error,
    // don't do any other IO on the socket and do not call shutdown (just close it).
    void recv(void* buffer, size_t len, IoQueue::HandlerEcRes handler);
    void send(const void* buffer, size_t len, IoQueue::HandlerEcRes handler);
    void shutdown(IoQueue::HandlerEc handler);

private:
    struct SslOperationResult {
        int result;
        int error;
        unsigned long queueError;
    };

    struct SslOperationState {
        IoQueue::HandlerEcRes handler = nullptr;
        SslOperation currentOp = SslOperation::Invalid;
        void* buffer = nullptr;
        int length = 0;
        int lastResult = 0;
        int lastError = 0;
    };

    static SslOperationResult performSslOperation(
        SslOperation op, SSL* ssl, void* buffer, int length);

    void startSslOperation(
        SslOperation op, void* buffer, int length, IoQueue::HandlerEcRes handler);
    void performSslOperation();
    void processSslOperationResult(const SslOperationResult& result);
    void updateSslOperation();
    void completeSslOperation(std::error_code ec, int result);

    std::shared_ptr<SslContext> context_;
    SSL* ssl_ = nullptr;
    BIO* externalBio_ = nullptr;
    std::vector<char> recvBuffer_;
    std::vector<char> sendBuffer_;
    SslOperationState state_;
};

struct SslClientConnectionFactory {
    using Connection = SslConnection;

    std::shared_ptr<SslContext> context = SslContext::createClient();

    // Returns nullptr if no TLS context or connection could be created
    std::unique_ptr<Connection> create(IoQueue& io, int fd, uint64_t timeoutMs)
    {
        if (!context) {
            return nullptr;
        }
        auto conn = std::make_unique<Connection>(io, fd, timeoutMs, context);
        return conn->valid() ? std::move(conn) : nullptr;
    }
};
