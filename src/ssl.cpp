#include "ssl.hpp"

#include <cassert>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include "log.hpp"

std::string getSslErrorString()
{
    auto err = ERR_get_error();
    char buf[256];
    std::string errStr = "no error";
    size_t num = 0;
    while (err != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
        if (num == 0) {
            errStr = "";
        } else {
            errStr.append(", ");
        }
        errStr.append(buf);
        err = ERR_get_error();
        ++num;
    }
    return errStr;
}

std::string sslErrorToString(int sslError)
{
    switch (sslError) {
    case SSL_ERROR_NONE:
        return "SSL_ERROR_NONE";
    case SSL_ERROR_SSL:
        return "SSL_ERROR_SSL";
    case SSL_ERROR_WANT_READ:
        return "SSL_ERROR_WANT_READ";
    case SSL_ERROR_WANT_WRITE:
        return "SSL_ERROR_WANT_WRITE";
    case SSL_ERROR_WANT_X509_LOOKUP:
        return "SSL_ERROR_WANT_X509_LOOKUP";
    case SSL_ERROR_SYSCALL:
        return "SSL_ERROR_SYSCALL";
    case SSL_ERROR_ZERO_RETURN:
        return "SSL_ERROR_ZERO_RETURN";
    case SSL_ERROR_WANT_CONNECT:
        return "SSL_ERROR_WANT_CONNECT";
    case SSL_ERROR_WANT_ACCEPT:
        return "SSL_ERROR_WANT_ACCEPT";
    case SSL_ERROR_WANT_ASYNC:
        return "SSL_ERROR_WANT_ASYNC";
    case SSL_ERROR_WANT_ASYNC_JOB:
        return "SSL_ERROR_WANT_ASYNC_JOB";
    case SSL_ERROR_WANT_CLIENT_HELLO_CB:
        return "SSL_ERROR_WANT_CLIENT_HELLO_CB";
    default:
        return "Unknown (" + std::to_string(sslError) + ")";
    }
}

std::shared_ptr<SslContext> SslContext::createClient()
{
    auto ctx = std::make_shared<SslContext>();
    if (!static_cast<SSL_CTX*>(*ctx)) {
        return nullptr;
    }
    if (!ctx->init()) {
        return nullptr;
    }
    return ctx;
}

SslContext::SslContext()
    : ctx_(SSL_CTX_new(TLS_client_method()))
{
    if (!ctx_) {
        slog::error("Could not create SSL context: ", getSslErrorString());
        return;
    }
    if (SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION) != 1) {
        slog::error("Could not set minimum protocol version: ", getSslErrorString());
    }
}

SslContext::~SslContext()
{
    SSL_CTX_free(ctx_);
}

bool SslContext::init()
{
    assert(ctx_);
    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        slog::error("Could not load default CA certificates: ", getSslErrorString());
        return false;
    }
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    return true;
}

SslContext::operator SSL_CTX*()
{
    return ctx_;
}

const char* OpenSslErrorCategory::name() const noexcept
{
    return "OpenSSL Error Category";
}

std::string OpenSslErrorCategory::message(int errorCode) const
{
    char buf[256];
    ERR_error_string_n(static_cast<unsigned long>(errorCode), buf, sizeof(buf));
    return buf;
}

std::error_code OpenSslErrorCategory::makeError(unsigned long err)
{
    // An empty error queue (e.g. SSL_ERROR_SYSCALL on EOF) must still be an error
    if (err == 0) {
        return std::make_error_code(std::errc::connection_aborted);
    }
    return std::error_code { static_cast<int>(err), getOpenSslErrorCategory() };
}

OpenSslErrorCategory& getOpenSslErrorCategory()
{
    static OpenSslErrorCategory cat;
    return cat;
}

std::string toString(SslOperation op)
{
    switch (op) {
    case SslOperation::Read:
        return "SSL_read";
    case SslOperation::Write:
        return "SSL_write";
    case SslOperation::Shutdown:
        return "SSL_shutdown";
    default:
        return "Unknown (" + std::to_string(static_cast<int>(op)) + ")";
    }
}

SslConnection::SslConnection(
    IoQueue& io, int fd, uint64_t timeoutMs, std::shared_ptr<SslContext> context)
    : TcpConnection(io, fd, timeoutMs)
    , context_(std::move(context))
    , ssl_(SSL_new(*context_))
{
    if (!ssl_) {
        slog::error("Could not create SSL object: ", getSslErrorString());
        return;
    }

    SSL_set_mode(ssl_, SSL_MODE_RELEASE_BUFFERS);

    BIO* internalBio = nullptr;
    if (BIO_new_bio_pair(&internalBio, 0, &externalBio_, 0) != 1) {
        slog::error("Could not create BIO pair: ", getSslErrorString());
        SSL_free(ssl_);
        ssl_ = nullptr;
        externalBio_ = nullptr;
        return;
    }
    SSL_set_bio(ssl_, internalBio, internalBio);
    SSL_set_connect_state(ssl_);

    // 16K is maximum TLS record size, but 17*1024 is default BIO size.
    recvBuffer_.resize(17 * 1024, 0);
    sendBuffer_.resize(17 * 1024, 0);

    // The handshake is performed implicitly by the first SSL_write
}

SslConnection::~SslConnection()
{
    SSL_free(ssl_);
    BIO_free(externalBio_);
}

bool SslConnection::valid() const
{
    return ssl_ != nullptr;
}

bool SslConnection::setHostname(const std::string& hostname)
{
    if (SSL_set_tlsext_host_name(ssl_, hostname.c_str()) != 1) {
        slog::error("Could not set SNI hostname: ", getSslErrorString());
        return false;
    }
    SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
    if (!SSL_set1_host(ssl_, hostname.c_str())) {
        slog::error("Could not set hostname for validation");
        return false;
    }
    SSL_set_verify(ssl_, SSL_VERIFY_PEER, nullptr);
    return true;
}

void SslConnection::recv(void* buffer, size_t len, IoQueue::HandlerEcRes handler)
{
    startSslOperation(SslOperation::Read, buffer, static_cast<int>(len), std::move(handler));
}

void SslConnection::send(const void* buffer, size_t len, IoQueue::HandlerEcRes handler)
{
    // The buffer is only ever passed to SSL_write as const void*
    startSslOperation(
        SslOperation::Write, const_cast<void*>(buffer), static_cast<int>(len), std::move(handler));
}

void SslConnection::shutdown(IoQueue::HandlerEc handler)
{
    startSslOperation(SslOperation::Shutdown, nullptr, 0,
        [handler = std::move(handler)](std::error_code ec, int) { handler(ec); });
}

SslConnection::SslOperationResult SslConnection::performSslOperation(
    SslOperation op, SSL* ssl, void* buffer, int length)
{
    // Make sure the SSL_get_error below this gives us the most recent error
    ::ERR_clear_error();

    int result = 0;
    switch (op) {
    case SslOperation::Read:
        result = SSL_read(ssl, buffer, length);
        break;
    case SslOperation::Write:
        result = SSL_write(ssl, const_cast<const void*>(buffer), length);
        break;
    case SslOperation::Shutdown: {
        // 0 means our close_notify was sent, but the peer's was not received yet
        result = SSL_shutdown(ssl);
        if (result == 0) {
            result = SSL_shutdown(ssl);
        }
        break;
    }
    default:
        return SslOperationResult { -1, SSL_ERROR_SSL, 0 };
    }

    const auto error = SSL_get_error(ssl, result);
    const auto queueError = ERR_peek_error();

    ::ERR_clear_error();

    return SslOperationResult { result, error, queueError };
}

void SslConnection::performSslOperation()
{
    const auto res = performSslOperation(state_.currentOp, ssl_, state_.buffer, state_.length);
    state_.lastResult = res.result;
    state_.lastError = res.error;
    processSslOperationResult(res);
}

void SslConnection::startSslOperation(
    SslOperation op, void* buffer, int length, IoQueue::HandlerEcRes handler)
{
    state_ = SslOperationState { std::move(handler), op, buffer, length };
    performSslOperation();
}

void SslConnection::updateSslOperation()
{
    if (state_.lastError == SSL_ERROR_NONE) {
        completeSslOperation(std::error_code {}, state_.lastResult);
    } else if (state_.lastError == SSL_ERROR_ZERO_RETURN) {
        completeSslOperation(std::error_code {}, 0);
    } else {
        performSslOperation();
    }
}

void SslConnection::completeSslOperation(std::error_code ec, int result)
{
    // Reset before calling, because the handler might start the next operation
    auto handler = std::move(state_.handler);
    state_ = SslOperationState {};
    handler(ec, result);
}

void SslConnection::processSslOperationResult(const SslOperationResult& result)
{
    // Number of bytes that are waiting to be sent
    const auto pending = BIO_ctrl_pending(externalBio_);

    if (result.error == SSL_ERROR_SSL || result.error == SSL_ERROR_SYSCALL) {
        // Non-recoverable, SSL_shutdown must not be called
        const auto ec = OpenSslErrorCategory::makeError(result.queueError);
        slog::debug("SSL Error ", sslErrorToString(result.error), " in ",
            toString(state_.currentOp), ": ", ec.message());
        completeSslOperation(ec, -1);
    } else if (pending > 0 || result.error == SSL_ERROR_WANT_WRITE) {
        // Pending bytes have to go out first, even if the operation is finished
        const auto readFromBio
            = BIO_read(externalBio_, sendBuffer_.data(), static_cast<int>(sendBuffer_.size()));
        if (readFromBio <= 0) {
            completeSslOperation(OpenSslErrorCategory::makeError(ERR_peek_error()), -1);
            return;
        }

        TcpConnection::send(sendBuffer_.data(), static_cast<size_t>(readFromBio),
            [this, readFromBio](std::error_code ec, int sentBytes) {
                if (ec) {
                    slog::debug("Error in send (SSL): ", ec.message());
                    // Like a SSL_ERROR_SYSCALL, so SSL_shutdown must not be called
                    completeSslOperation(ec, -1);
                    return;
                }

                if (sentBytes == 0) {
                    completeSslOperation(std::error_code {}, 0);
                    return;
                }

                if (sentBytes < readFromBio) {
                    // The BIO pair is drained already, so a short write loses data
                    completeSslOperation(std::make_error_code(std::errc::message_size), -1);
                    return;
                }
                updateSslOperation();
            });
    } else if (result.error == SSL_ERROR_WANT_READ) {
        TcpConnection::recv(
            recvBuffer_.data(), recvBuffer_.size(), [this](std::error_code ec, int readBytes) {
                if (ec) {
                    slog::debug("Error in recv (SSL): ", ec.message());
                    completeSslOperation(ec, -1);
                    return;
                }

                if (readBytes == 0) {
                    completeSslOperation(std::error_code {}, 0);
                    return;
                }

                BIO_write(externalBio_, recvBuffer_.data(), readBytes);
                updateSslOperation();
            });
    } else if (result.error == SSL_ERROR_NONE) {
        completeSslOperation(std::error_code {}, result.result);
    } else if (result.error == SSL_ERROR_ZERO_RETURN) {
        // The remote peer closed the connection.
        completeSslOperation(std::error_code {}, 0);
    } else {
        const auto ec = OpenSslErrorCategory::makeError(result.queueError);
        slog::error("Unexpected SSL error ", sslErrorToString(result.error), " in ",
            toString(state_.currentOp), ": ", ec.message());
        completeSslOperation(ec, -1);
    }
}
