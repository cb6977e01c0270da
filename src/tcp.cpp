#include "tcp.hpp"

#include <unistd.h>

#include "log.hpp"

TcpConnection::TcpConnection(IoQueue& io, int fd, uint64_t timeoutMs)
    : io_(io)
    , fd_(fd)
    , timeoutMs_(timeoutMs)
{
}

void TcpConnection::recv(void* buffer, size_t len, IoQueue::HandlerEcRes handler)
{
    auto shared = std::make_shared<IoQueue::HandlerEcRes>(std::move(handler));
    if (!io_.recv(fd_, buffer, len, timeoutMs_,
            [shared](std::error_code ec, int res) { (*shared)(ec, res); })) {
        slog::error("Could not queue recv");
        (*shared)(std::make_error_code(std::errc::resource_unavailable_try_again), -1);
    }
}

void TcpConnection::send(const void* buffer, size_t len, IoQueue::HandlerEcRes handler)
{
    auto shared = std::make_shared<IoQueue::HandlerEcRes>(std::move(handler));
    if (!io_.send(fd_, buffer, len, timeoutMs_,
            [shared](std::error_code ec, int res) { (*shared)(ec, res); })) {
        slog::error("Could not queue send");
        (*shared)(std::make_error_code(std::errc::resource_unavailable_try_again), -1);
    }
}

void TcpConnection::close()
{
    if (!io_.close(fd_, [](std::error_code /*ec*/) {})) {
        // Synchronous fallback, so the descriptor is not leaked
        ::close(fd_);
    }
}
