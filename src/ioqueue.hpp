#pragma once

#include <cstdint>
#include <future>
#include <limits>
#include <system_error>
#include <thread>

#include <sys/socket.h>

#include "function.hpp"
#include "iouring.hpp"
#include "log.hpp"
#include "slotmap.hpp"

// Single-threaded completion-based event loop. All functions must be called from the thread that
// calls run() (usually the main thread). Every operation completes exactly once through its
// handler. If an operation can't be queued, the function returns false and the handler is never
// called.
class IoQueue {
private:
    using CompletionHandler = Function<void(const io_uring_cqe*)>;

    static constexpr auto Ignore = std::numeric_limits<uint64_t>::max();

public:
    using HandlerEc = Function<void(std::error_code ec)>;
    using HandlerEcRes = Function<void(std::error_code ec, int res)>;
    using Timespec = IoURing::Timespec;

    static void setRelativeTimeout(Timespec* ts, uint64_t milliseconds);

    IoQueue(size_t size = 1024, bool submissionQueuePolling = false);

    size_t getSize() const;

    size_t getCapacity() const;

    bool connect(int sockfd, const ::sockaddr* addr, socklen_t addrlen, HandlerEc cb);

    bool connect(int sockfd, const ::sockaddr* addr, socklen_t addrlen, uint64_t timeoutMs,
        HandlerEc cb);

    // res argument is sent bytes
    bool send(int sockfd, const void* buf, size_t len, HandlerEcRes cb);

    // If the operation does not complete within timeoutMs, it fails with
    // std::errc::operation_canceled. A timeout of 0 means no timeout.
    bool send(int sockfd, const void* buf, size_t len, uint64_t timeoutMs, HandlerEcRes cb);

    // res argument is received bytes
    bool recv(int sockfd, void* buf, size_t len, HandlerEcRes cb);

    bool recv(int sockfd, void* buf, size_t len, uint64_t timeoutMs, HandlerEcRes cb);

    bool read(int fd, void* buf, size_t count, HandlerEcRes cb);

    bool close(int fd, HandlerEc cb);

    // Calls cb (with no error) after the given time has passed
    bool timeout(uint64_t milliseconds, HandlerEc cb);

    class NotifyHandle {
    public:
        NotifyHandle(int fd);

        // wait might fail, in which case this will return false
        explicit operator bool() const;

        // Writes SYNCHRONOUSLY to an eventfd, so it is meant to be called from other threads.
        // It must be called exactly once, otherwise the read queued by wait never completes.
        void notify(uint64_t value = 1);

    private:
        int fd_;
    };

    // This will call a handler callback, when the NotifyHandle is notified.
    // The value passed to NotifyHandle::notify will be passed to the handler cb.
    NotifyHandle wait(Function<void(std::error_code, uint64_t)> cb);

    // Runs func on a separate thread and calls cb with its result on the IoQueue thread.
    // Used for blocking calls that have no io_uring equivalent (getaddrinfo).
    template <typename Result>
    bool async(Function<Result()> func, Function<void(std::error_code, Result&&)> cb)
    {
        std::promise<Result> prom;
        auto handle = wait(
            [fut = prom.get_future(), cb = std::move(cb)](std::error_code ec, uint64_t) mutable {
                if (ec) {
                    cb(ec, Result());
                } else {
                    cb(std::error_code(), fut.get());
                }
            });
        if (!handle) {
            return false;
        }

        // The thread owns everything it needs, so it can be detached.
        std::thread t(
            [func = std::move(func), prom = std::move(prom), handle = std::move(handle)]() mutable {
                prom.set_value(func());
                handle.notify();
            });
        t.detach();
        return true;
    }

    // Returns when there are no more pending operations
    void run();

private:
    size_t addHandler(HandlerEc&& cb);
    size_t addHandler(HandlerEcRes&& cb);

    template <typename Callback>
    bool addSqe(io_uring_sqe* sqe, Callback cb);

    template <typename Callback>
    bool addSqe(io_uring_sqe* sqe, uint64_t timeoutMs, Callback cb);

    IoURing ring_;
    SlotMap<CompletionHandler> completionHandlers_;
};
