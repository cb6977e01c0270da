#pragma once

#include <memory>

#include "ioqueue.hpp"

class TcpConnection {
public:
    // A timeout of 0 means every send and recv may block indefinitely
    TcpConnection(IoQueue& io, int fd, uint64_t timeoutMs = 0);

    // If the operation could not be queued, the handler is called with an error immediately
    void recv(void* buffer, size_t len, IoQueue::HandlerEcRes handler);
    void send(const void* buffer, size_t len, IoQueue::HandlerEcRes handler);
    void close();

protected:
    IoQueue& io_;
    int fd_;
    uint64_t timeoutMs_;
};

struct TcpConnectionFactory {
    using Connection = TcpConnection;

    std::unique_ptr<Connection> create(IoQueue& io, int fd, uint64_t timeoutMs)
    {
        return std::make_unique<Connection>(io, fd, timeoutMs);
    }
};
