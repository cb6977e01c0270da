#include "iouring.hpp"

#include <cerrno>
#include <cstring>

IoURing::~IoURing()
{
    if (initialized_) {
        ::io_uring_queue_exit(&ring_);
    }
}

bool IoURing::init(size_t sqEntries, bool submissionQueuePolling)
{
    std::memset(&params_, 0, sizeof(params_));
    if (submissionQueuePolling) {
        params_.flags |= IORING_SETUP_SQPOLL;
        params_.sq_thread_idle = 2000;
    }
    const auto res
        = ::io_uring_queue_init_params(static_cast<unsigned>(sqEntries), &ring_, &params_);
    if (res < 0) {
        // liburing returns -errno, but callers want to report errno
        errno = -res;
        return false;
    }
    initialized_ = true;
    return true;
}

const io_uring_params& IoURing::getParams() const
{
    return params_;
}

size_t IoURing::getNumSqeEntries() const
{
    return ::io_uring_sq_ready(&ring_);
}

size_t IoURing::getSqeCapacity() const
{
    return params_.sq_entries;
}

io_uring_sqe* IoURing::getSqe()
{
    return ::io_uring_get_sqe(&ring_);
}

io_uring_sqe* IoURing::prepareConnect(int fd, const ::sockaddr* addr, socklen_t addrLen)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_connect(sqe, fd, addr, addrLen);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareSend(int fd, const void* buf, size_t len)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_send(sqe, fd, buf, len, 0);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareRecv(int fd, void* buf, size_t len)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_recv(sqe, fd, buf, len, 0);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareRead(int fd, void* buf, size_t count)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_read(sqe, fd, buf, static_cast<unsigned>(count), 0);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareClose(int fd)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_close(sqe, fd);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareTimeout(Timespec* ts, unsigned flags)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_timeout(sqe, ts, 0, flags);
    }
    return sqe;
}

io_uring_sqe* IoURing::prepareLinkTimeout(Timespec* ts, unsigned flags)
{
    auto sqe = getSqe();
    if (sqe) {
        ::io_uring_prep_link_timeout(sqe, ts, flags);
    }
    return sqe;
}

int IoURing::submitSqes(unsigned waitNr)
{
    return ::io_uring_submit_and_wait(&ring_, waitNr);
}

io_uring_cqe* IoURing::peekCqe()
{
    io_uring_cqe* cqe = nullptr;
    const auto res = ::io_uring_peek_cqe(&ring_, &cqe);
    if (res < 0) {
        return nullptr;
    }
    return cqe;
}

void IoURing::advanceCq(unsigned num)
{
    ::io_uring_cq_advance(&ring_, num);
}
