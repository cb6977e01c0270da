#pragma once

#include <array>
#include <cassert>
#include <cstring>
#include <memory>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "http.hpp"
#include "ioqueue.hpp"
#include "metrics.hpp"
#include "ssl.hpp"
#include "string.hpp"
#include "tcp.hpp"
#include "transport.hpp"
#include "util.hpp"

template <typename Connection>
constexpr uint16_t defaultPort = 0;

template <>
constexpr uint16_t defaultPort<TcpConnection> = 80;

template <>
constexpr uint16_t defaultPort<SslConnection> = 443;

// A single HTTP/1.1 request on a fresh connection ("Connection: close").
// The session keeps itself alive through the handlers it queues.
template <typename ConnectionFactory>
class ClientSession : public std::enable_shared_from_this<ClientSession<ConnectionFactory>> {
public:
    using Connection = typename ConnectionFactory::Connection;
    using Callback = Transport::Callback;

    static std::shared_ptr<ClientSession> create(
        IoQueue& io, std::string_view host, uint16_t port, uint64_t timeoutMs)
    {
        return std::shared_ptr<ClientSession>(new ClientSession(io, host, port, timeoutMs));
    }

    bool request(Method method, std::string_view target, const HeaderMap<>& headers,
        const std::string& requestBody, Callback cb)
    {
        if (callback_) {
            // Request already in progress. Pipelining is not supported.
            return false;
        }
        method_ = method;
        reader_ = ResponseReader(method);
        callback_ = std::move(cb);
        requestBuffer_ = serializeRequest(method, target, headers, requestBody);
        resolve();
        return true;
    }

private:
    static ConnectionFactory& getConnectionFactory()
    {
        static ConnectionFactory factory;
        return factory;
    }

    ClientSession(IoQueue& io, std::string_view host, uint16_t port, uint64_t timeoutMs)
        : io_(io)
        , host_(host)
        , port_(port ? port : defaultPort<Connection>)
        , timeoutMs_(timeoutMs)
    {
        std::memset(&connectAddr_, 0, sizeof(connectAddr_));
        connectAddr_.ss_family = AF_UNSPEC;
    }

    void resolve()
    {
        // getaddrinfo blocks, so it runs on a separate thread
        const auto queued = io_.async<std::vector<::sockaddr_storage>>(
            [host = host_, port = port_]() {
                struct ::addrinfo hints;
                std::memset(&hints, 0, sizeof(hints));
                hints.ai_family = AF_UNSPEC;
                hints.ai_socktype = SOCK_STREAM;

                std::vector<::sockaddr_storage> addrs;
                ::addrinfo* result = nullptr;
                const auto portStr = std::to_string(port);
                const auto res = ::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
                if (res != 0) {
                    slog::error("Could not resolve '", host, "': ", ::gai_strerror(res));
                    return addrs;
                }
                for (::addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
                    std::memcpy(&addrs.emplace_back(), ai->ai_addr, ai->ai_addrlen);
                }
                ::freeaddrinfo(result);
                return addrs;
            },
            [self = this->shared_from_this()](
                std::error_code ec, std::vector<::sockaddr_storage>&& addrs) {
                if (ec) {
                    slog::error("Error doing async resolve: ", ec.message());
                    self->finish(ec);
                    return;
                }
                if (addrs.empty()) {
                    self->finish(std::make_error_code(std::errc::host_unreachable));
                    return;
                }
                // The first address is the preferred one (RFC 6724)
                std::memcpy(&self->connectAddr_, &addrs[0], sizeof(::sockaddr_storage));
                self->connect();
            });
        if (!queued) {
            finish(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
    }

    void connect()
    {
        assert(!connection_);
        assert(connectAddr_.ss_family == AF_INET || connectAddr_.ss_family == AF_INET6);
        const auto sock = ::socket(connectAddr_.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (sock == -1) {
            slog::error("Error creating socket: ", errnoToString(errno));
            finish(std::make_error_code(static_cast<std::errc>(errno)));
            return;
        }
        const auto addrLen
            = connectAddr_.ss_family == AF_INET ? sizeof(::sockaddr_in) : sizeof(::sockaddr_in6);
        const auto queued = io_.connect(sock, reinterpret_cast<const ::sockaddr*>(&connectAddr_),
            addrLen, timeoutMs_, [self = this->shared_from_this(), sock](std::error_code ec) {
                if (ec) {
                    slog::error("Error connecting to '", self->host_, "': ", ec.message());
                    ::close(sock);
                    self->finish(ec);
                    return;
                }
                self->connection_ = getConnectionFactory().create(self->io_, sock, self->timeoutMs_);
                if (!self->connection_) {
                    ::close(sock);
                    self->finish(std::make_error_code(std::errc::not_connected));
                    return;
                }
                if constexpr (std::is_same_v<Connection, SslConnection>) {
                    if (!self->connection_->setHostname(self->host_)) {
                        self->finish(std::make_error_code(std::errc::invalid_argument));
                        return;
                    }
                }
                self->send();
            });
        if (!queued) {
            ::close(sock);
            finish(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
    }

    void send()
    {
        assert(sendCursor_ < requestBuffer_.size());
        connection_->send(requestBuffer_.data() + sendCursor_, requestBuffer_.size() - sendCursor_,
            [self = this->shared_from_this()](std::error_code ec, int sentBytes) {
                if (ec) {
                    slog::error("Error sending request: ", ec.message());
                    self->finish(ec);
                    return;
                }

                if (sentBytes == 0) {
                    self->finish(std::make_error_code(std::errc::connection_reset));
                    return;
                }

                assert(sentBytes > 0);
                self->sendCursor_ += static_cast<size_t>(sentBytes);
                if (self->sendCursor_ < self->requestBuffer_.size()) {
                    self->send();
                    return;
                }

                self->recv();
            });
    }

    void recv()
    {
        connection_->recv(recvBuffer_.data(), recvBuffer_.size(),
            [self = this->shared_from_this()](std::error_code ec, int readBytes) {
                if (ec) {
                    slog::error("Error in recv: ", ec.message());
                    self->finish(ec);
                    return;
                }
                const auto data
                    = std::string_view(self->recvBuffer_.data(), static_cast<size_t>(readBytes));
                switch (self->reader_.feed(data, readBytes == 0)) {
                case ResponseReader::State::Incomplete:
                    self->recv();
                    return;
                case ResponseReader::State::Complete:
                    self->complete();
                    return;
                case ResponseReader::State::Error:
                    self->finish(self->reader_.error());
                    return;
                }
            });
    }

    void complete()
    {
        auto& response = reader_.response();
        Metrics::get()
            .httpRequests
            .labels(toString(method_), std::to_string(static_cast<uint32_t>(response.status)))
            .inc();
        Metrics::get().httpResponseSize.labels(toString(method_)).observe(response.body.size());
        auto cb = std::move(callback_);
        callback_ = nullptr;
        closeConnection();
        cb(std::error_code(), std::move(response));
    }

    void finish(std::error_code ec)
    {
        Metrics::get().httpRequests.labels(toString(method_), "error").inc();
        auto cb = std::move(callback_);
        callback_ = nullptr;
        closeConnection();
        if (cb) {
            cb(ec, Response());
        }
    }

    void closeConnection()
    {
        if (connection_) {
            connection_->close();
            connection_.reset();
        }
    }

    std::string serializeRequest(
        Method method, std::string_view target, const HeaderMap<>& headers, std::string_view body)
    {
        std::string req;
        req.reserve(512 + body.size());
        req.append(toString(method));
        req.append(" ");
        req.append(target);
        req.append(" HTTP/1.1\r\n");
        if (!headers.contains("Host")) {
            req.append("Host: ");
            req.append(host_);
            if (port_ != defaultPort<Connection>) {
                req.append(":");
                req.append(std::to_string(port_));
            }
            req.append("\r\n");
        }
        if (!headers.contains("Connection")) {
            req.append("Connection: close\r\n");
        }
        headers.serialize(req);
        if ((body.size() || method == Method::Post) && !headers.contains("Content-Length")) {
            req.append("Content-Length: " + std::to_string(body.size()) + "\r\n");
        }
        req.append("\r\n");
        req.append(body);
        return req;
    }

    IoQueue& io_;
    std::string host_;
    uint16_t port_ = 0;
    uint64_t timeoutMs_ = 0;
    ::sockaddr_storage connectAddr_;
    Method method_ = Method::Get;
    Callback callback_ = nullptr;
    std::string requestBuffer_;
    size_t sendCursor_ = 0;
    std::array<char, 4096> recvBuffer_;
    ResponseReader reader_ { Method::Get };
    std::unique_ptr<Connection> connection_;
};

// Transport over the IoQueue. Every request uses a new connection. This must be used from the
// thread running the IoQueue.
class HttpTransport : public Transport {
public:
    HttpTransport(IoQueue& io, uint64_t timeoutMs = 0, std::string userAgent = "whacme");

    void request(Method method, const std::string& url, const HeaderMap<>& headers,
        const std::string& body, Callback cb) override;

private:
    IoQueue& io_;
    uint64_t timeoutMs_;
    std::string userAgent_;
};
