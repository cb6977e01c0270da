#pragma once

#include <cstddef>

#include <liburing.h>

// Thin RAII wrapper around liburing, so the rest of the code only ever sees prepare/submit/peek.
class IoURing {
public:
    using Timespec = __kernel_timespec;

    IoURing() = default;
    ~IoURing();

    IoURing(const IoURing&) = delete;
    IoURing& operator=(const IoURing&) = delete;

    bool init(size_t sqEntries, bool submissionQueuePolling);

    const io_uring_params& getParams() const;

    size_t getNumSqeEntries() const;
    size_t getSqeCapacity() const;

    // All of these return nullptr if the submission queue is full
    io_uring_sqe* prepareConnect(int fd, const ::sockaddr* addr, socklen_t addrLen);
    io_uring_sqe* prepareSend(int fd, const void* buf, size_t len);
    io_uring_sqe* prepareRecv(int fd, void* buf, size_t len);
    io_uring_sqe* prepareRead(int fd, void* buf, size_t count);
    io_uring_sqe* prepareClose(int fd);
    io_uring_sqe* prepareTimeout(Timespec* ts, unsigned flags = 0);
    io_uring_sqe* prepareLinkTimeout(Timespec* ts, unsigned flags = 0);

    // Submits all prepared SQEs and waits until at least waitNr CQEs are available.
    // Returns the number of submitted SQEs or -errno.
    int submitSqes(unsigned waitNr = 0);

    io_uring_cqe* peekCqe();
    void advanceCq(unsigned num = 1);

private:
    io_uring_sqe* getSqe();

    io_uring ring_;
    io_uring_params params_ {};
    bool initialized_ = false;
};
