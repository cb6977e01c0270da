#include "ioqueue.hpp"

#include <cassert>
#include <cerrno>
#include <memory>

#include <sys/eventfd.h>
#include <unistd.h>

#include "metrics.hpp"
#include "util.hpp"

void IoQueue::setRelativeTimeout(Timespec* ts, uint64_t milliseconds)
{
    ts->tv_sec = static_cast<int64_t>(milliseconds / 1000);
    ts->tv_nsec = static_cast<long long>((milliseconds % 1000) * 1000 * 1000);
}

IoQueue::IoQueue(size_t size, bool submissionQueuePolling)
    : completionHandlers_(size)
{
    if (!ring_.init(size, submissionQueuePolling)) {
        slog::fatal("Could not create io_uring: ", errnoToString(errno));
        std::exit(1);
    }
    if (!(ring_.getParams().features & IORING_FEAT_NODROP)) {
        slog::fatal("io_uring does not support NODROP");
        std::exit(1);
    }
    if (!(ring_.getParams().features & IORING_FEAT_SUBMIT_STABLE)) {
        slog::fatal("io_uring does not support SUBMIT_STABLE");
        std::exit(1);
    }
}

size_t IoQueue::getSize() const
{
    return ring_.getNumSqeEntries();
}

size_t IoQueue::getCapacity() const
{
    return ring_.getSqeCapacity();
}

bool IoQueue::connect(int sockfd, const ::sockaddr* addr, socklen_t addrlen, HandlerEc cb)
{
    return addSqe(ring_.prepareConnect(sockfd, addr, addrlen), std::move(cb));
}

bool IoQueue::connect(
    int sockfd, const ::sockaddr* addr, socklen_t addrlen, uint64_t timeoutMs, HandlerEc cb)
{
    return addSqe(ring_.prepareConnect(sockfd, addr, addrlen), timeoutMs, std::move(cb));
}

bool IoQueue::send(int sockfd, const void* buf, size_t len, HandlerEcRes cb)
{
    return addSqe(ring_.prepareSend(sockfd, buf, len), std::move(cb));
}

bool IoQueue::send(int sockfd, const void* buf, size_t len, uint64_t timeoutMs, HandlerEcRes cb)
{
    return addSqe(ring_.prepareSend(sockfd, buf, len), timeoutMs, std::move(cb));
}

bool IoQueue::recv(int sockfd, void* buf, size_t len, HandlerEcRes cb)
{
    return addSqe(ring_.prepareRecv(sockfd, buf, len), std::move(cb));
}

bool IoQueue::recv(int sockfd, void* buf, size_t len, uint64_t timeoutMs, HandlerEcRes cb)
{
    return addSqe(ring_.prepareRecv(sockfd, buf, len), timeoutMs, std::move(cb));
}

bool IoQueue::read(int fd, void* buf, size_t count, HandlerEcRes cb)
{
    return addSqe(ring_.prepareRead(fd, buf, count), std::move(cb));
}

bool IoQueue::close(int fd, HandlerEc cb)
{
    return addSqe(ring_.prepareClose(fd), std::move(cb));
}

bool IoQueue::timeout(uint64_t milliseconds, HandlerEc cb)
{
    // The timespec has to stay alive until the SQE is submitted, so it's owned by the handler
    auto ts = std::make_unique<Timespec>();
    setRelativeTimeout(ts.get(), milliseconds);
    auto sqe = ring_.prepareTimeout(ts.get());
    return addSqe(sqe, HandlerEc([ts = std::move(ts), cb = std::move(cb)](std::error_code ec) {
        // An expired timeout completes with -ETIME, which is what we want
        if (ec == std::errc::stream_timeout) {
            cb(std::error_code());
        } else {
            cb(ec);
        }
    }));
}

IoQueue::NotifyHandle::NotifyHandle(int fd)
    : fd_(fd)
{
}

IoQueue::NotifyHandle::operator bool() const
{
    return fd_ != -1;
}

void IoQueue::NotifyHandle::notify(uint64_t value)
{
    assert(fd_ != -1);
    const auto res = ::write(fd_, &value, sizeof(uint64_t));
    if (res != sizeof(uint64_t)) {
        // The handler can't be reached from here and the read can't be cancelled, so whoever is
        // waiting would hang forever.
        slog::fatal("Error writing to eventfd: ", errnoToString(errno));
        std::exit(1);
    }
    fd_ = -1;
}

IoQueue::NotifyHandle IoQueue::wait(Function<void(std::error_code, uint64_t)> cb)
{
    const auto fd = ::eventfd(0, 0);
    if (fd == -1) {
        slog::error("Could not create eventfd: ", errnoToString(errno));
        return NotifyHandle { -1 };
    }
    auto buf = std::make_unique<uint64_t>(0);
    auto bufData = buf.get();
    const auto res = read(fd, bufData, sizeof(uint64_t),
        [fd, buf = std::move(buf), cb = std::move(cb)](std::error_code ec, int res) {
            ::close(fd);
            if (ec) {
                cb(ec, 0);
            } else {
                // man 2 eventfd: Each successful read(2) returns an 8-byte integer.
                assert(res == sizeof(uint64_t));
                cb(std::error_code(), *buf);
            }
        });
    if (res) {
        return NotifyHandle { fd };
    } else {
        ::close(fd);
        return NotifyHandle { -1 };
    }
}

void IoQueue::run()
{
    while (completionHandlers_.size() > 0) {
        const auto res = ring_.submitSqes(1);
        if (res < 0) {
            if (res != -EINTR) {
                slog::error("Error submitting SQEs: ", errnoToString(-res));
            }
            continue;
        }
        const auto cqe = ring_.peekCqe();
        if (!cqe) {
            continue;
        }

        const auto userData = cqe->user_data;
        if (userData != Ignore) {
            assert(completionHandlers_.contains(userData));
            Metrics::get().ioQueueOpsQueued.labels().dec();
            auto ch = std::move(completionHandlers_[userData]);
            completionHandlers_.remove(userData);
            ch(cqe);
        }
        ring_.advanceCq();
    }
}

size_t IoQueue::addHandler(HandlerEc&& cb)
{
    return completionHandlers_.emplace([cb = std::move(cb)](const io_uring_cqe* cqe) {
        if (cqe->res < 0) {
            cb(std::make_error_code(static_cast<std::errc>(-cqe->res)));
        } else {
            cb(std::error_code());
        }
    });
}

size_t IoQueue::addHandler(HandlerEcRes&& cb)
{
    return completionHandlers_.emplace([cb = std::move(cb)](const io_uring_cqe* cqe) {
        if (cqe->res < 0) {
            cb(std::make_error_code(static_cast<std::errc>(-cqe->res)), -1);
        } else {
            cb(std::error_code(), cqe->res);
        }
    });
}

template <typename Callback>
bool IoQueue::addSqe(io_uring_sqe* sqe, Callback cb)
{
    if (!sqe) {
        slog::warning("io_uring full");
        return false;
    }
    Metrics::get().ioQueueOpsQueued.labels().inc();
    sqe->user_data = addHandler(std::move(cb));
    return true;
}

template <typename Callback>
bool IoQueue::addSqe(io_uring_sqe* sqe, uint64_t timeoutMs, Callback cb)
{
    if (timeoutMs == 0) {
        return addSqe(sqe, std::move(cb));
    }
    if (!sqe) {
        slog::warning("io_uring full");
        return false;
    }
    // Linked timeouts are only prepared (not submitted) here, so they need their own storage that
    // lives as long as the operation's handler.
    auto ts = std::make_unique<Timespec>();
    setRelativeTimeout(ts.get(), timeoutMs);
    auto tsData = ts.get();
    sqe->flags |= IOSQE_IO_LINK;
    Metrics::get().ioQueueOpsQueued.labels().inc();
    sqe->user_data
        = addHandler(Callback([ts = std::move(ts), cb = std::move(cb)](auto&&... args) mutable {
              cb(std::forward<decltype(args)>(args)...);
          }));
    auto timeoutSqe = ring_.prepareLinkTimeout(tsData);
    if (!timeoutSqe) {
        // The operation is queued, but without a timeout. Better than not doing it at all.
        slog::warning("io_uring full, could not add timeout");
        sqe->flags &= ~IOSQE_IO_LINK;
        return true;
    }
    timeoutSqe->user_data = Ignore;
    return true;
}
