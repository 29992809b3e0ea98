#include "io_ring.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace memcli {

io_ring::io_ring(const logger& log, uint32_t queue_depth)
    : m_log(log), m_queue_depth(queue_depth)
{
}

io_ring::~io_ring()
{
    if (m_ready)
        io_uring_queue_exit(&m_ring);
}

bool io_ring::init()
{
    if (m_ready)
        return true;

    // Priority 1: SINGLE_ISSUER (one thread drives the ring, kernel 6.0+)
    {
        struct io_uring_params params{};
        params.flags = IORING_SETUP_SINGLE_ISSUER;
        if (io_uring_queue_init_params(m_queue_depth, &m_ring, &params) == 0)
            m_ready = true;
    }

    // Priority 2: plain mode
    if (!m_ready)
    {
        int ret = io_uring_queue_init(m_queue_depth, &m_ring, 0);
        if (ret < 0)
        {
            MEMCLI_LOG_DEBUG(m_log, std::string("io_uring unavailable (") + std::strerror(-ret)
                                    + "), using poll");
            return false;
        }
        m_ready = true;
    }

    struct io_uring_probe* probe = io_uring_get_probe_ring(&m_ring);
    if (probe)
    {
        bool usable = io_uring_opcode_supported(probe, IORING_OP_CONNECT)
                   && io_uring_opcode_supported(probe, IORING_OP_RECV)
                   && io_uring_opcode_supported(probe, IORING_OP_SEND)
                   && io_uring_opcode_supported(probe, IORING_OP_LINK_TIMEOUT);
        io_uring_free_probe(probe);
        if (!usable)
        {
            MEMCLI_LOG_DEBUG(m_log, "io_uring lacks socket opcodes, using poll");
            io_uring_queue_exit(&m_ring);
            m_ready = false;
            return false;
        }
    }

    return true;
}

inline struct io_uring_sqe* io_ring::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (__builtin_expect(!sqe, 0))
    {
        io_uring_submit(&m_ring);
        sqe = io_uring_get_sqe(&m_ring);
    }
    return sqe;
}

// The operation SQE must already be prepared (and flagged IOSQE_IO_LINK when
// a timeout is requested).
int io_ring::submit_and_reap(ring_request& op, std::chrono::milliseconds timeout)
{
    ring_request to{ ring_op_timeout, 0, true };
    struct __kernel_timespec ts{};

    if (timeout.count() > 0)
    {
        struct io_uring_sqe* tsqe = get_sqe();
        if (!tsqe)
            return -EBUSY;
        ts.tv_sec = timeout.count() / 1000;
        ts.tv_nsec = (timeout.count() % 1000) * 1000000LL;
        io_uring_prep_link_timeout(tsqe, &ts, 0);
        io_uring_sqe_set_data(tsqe, &to);
        to.done = false;
    }

    int ret = io_uring_submit(&m_ring);
    if (ret < 0)
        return ret;

    while (!op.done || !to.done)
    {
        struct io_uring_cqe* cqe = nullptr;
        ret = io_uring_wait_cqe(&m_ring, &cqe);
        if (ret == -EINTR)
            continue;
        if (ret < 0)
            return ret;

        auto* req = static_cast<ring_request*>(io_uring_cqe_get_data(cqe));
        if (req)
        {
            req->result = cqe->res;
            req->done = true;
        }
        io_uring_cqe_seen(&m_ring, cqe);
    }

    if (op.result == -ECANCELED && to.result == -ETIME)
        return -ETIME;
    return op.result;
}

int io_ring::connect(int fd, const struct sockaddr* addr, socklen_t len,
                     std::chrono::milliseconds timeout)
{
    if (!m_ready)
        return poll_connect(fd, addr, len, timeout);

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return -EBUSY;

    ring_request op{ ring_op_connect, 0, false };
    io_uring_prep_connect(sqe, fd, addr, len);
    io_uring_sqe_set_data(sqe, &op);
    if (timeout.count() > 0)
        io_uring_sqe_set_flags(sqe, IOSQE_IO_LINK);

    return submit_and_reap(op, timeout);
}

int io_ring::recv(int fd, char* buf, uint32_t len, int flags,
                  std::chrono::milliseconds timeout)
{
    if (!m_ready)
    {
        int rc = poll_wait(fd, POLLIN, timeout);
        if (rc < 0)
            return rc;
        for (;;)
        {
            ssize_t n = ::recv(fd, buf, len, flags);
            if (n >= 0)
                return static_cast<int>(n);
            if (errno != EINTR)
                return -errno;
        }
    }

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return -EBUSY;

    ring_request op{ ring_op_recv, 0, false };
    io_uring_prep_recv(sqe, fd, buf, len, flags);
    io_uring_sqe_set_data(sqe, &op);
    if (timeout.count() > 0)
        io_uring_sqe_set_flags(sqe, IOSQE_IO_LINK);

    return submit_and_reap(op, timeout);
}

int io_ring::send(int fd, const char* buf, uint32_t len,
                  std::chrono::milliseconds timeout)
{
    if (!m_ready)
    {
        int rc = poll_wait(fd, POLLOUT, timeout);
        if (rc < 0)
            return rc;
        for (;;)
        {
            ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
            if (n >= 0)
                return static_cast<int>(n);
            if (errno != EINTR)
                return -errno;
        }
    }

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return -EBUSY;

    ring_request op{ ring_op_send, 0, false };
    io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, &op);
    if (timeout.count() > 0)
        io_uring_sqe_set_flags(sqe, IOSQE_IO_LINK);

    return submit_and_reap(op, timeout);
}

// ─── poll(2) fallback ───

int io_ring::poll_wait(int fd, short events, std::chrono::milliseconds timeout)
{
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;

    // poll takes an int; longer timeouts are capped rather than wrapped
    int wait_ms = -1;
    if (timeout.count() > 0)
        wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(timeout.count(), INT_MAX));
    for (;;)
    {
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0)
        {
            if (errno == EINTR)
                continue;
            return -errno;
        }
        if (ret == 0)
            return -ETIME;
        // POLLHUP/POLLERR still let the following syscall report the cause
        return 0;
    }
}

int io_ring::poll_connect(int fd, const struct sockaddr* addr, socklen_t len,
                          std::chrono::milliseconds timeout)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return -errno;

    int result = 0;
    if (::connect(fd, addr, len) < 0)
    {
        if (errno != EINPROGRESS)
        {
            result = -errno;
        }
        else
        {
            result = poll_wait(fd, POLLOUT, timeout);
            if (result == 0)
            {
                int so_error = 0;
                socklen_t so_len = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0)
                    result = -errno;
                else
                    result = -so_error;
            }
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0 && result == 0)
        result = -errno;
    return result;
}

} // namespace memcli
