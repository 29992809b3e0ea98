#pragma once
#include <chrono>
#include <cstdint>
#include <liburing.h>
#include <sys/socket.h>

#include "logging.h"

namespace memcli {

enum ring_op : uint8_t
{
    ring_op_connect = 0,
    ring_op_recv    = 1,
    ring_op_send    = 2,
    ring_op_timeout = 3
};

struct ring_request
{
    ring_op type;
    int result;
    bool done;
};

// Synchronous io_uring front end: every call submits one socket operation
// linked to a timeout and waits for both completions before returning.
// All methods return the operation result (>= 0) or -errno; an operation cut
// short by its timeout returns -ETIME.
//
// When the ring cannot be created (old kernel, seccomp policy) the same calls
// are served by poll(2) plus the plain syscalls.
class io_ring
{
public:
    explicit io_ring(const logger& log, uint32_t queue_depth = 4);
    ~io_ring();

    io_ring(const io_ring&) = delete;
    io_ring& operator=(const io_ring&) = delete;

    bool init();
    bool uses_uring() const { return m_ready; }

    int connect(int fd, const struct sockaddr* addr, socklen_t len,
                std::chrono::milliseconds timeout);
    int recv(int fd, char* buf, uint32_t len, int flags,
             std::chrono::milliseconds timeout);
    int send(int fd, const char* buf, uint32_t len,
             std::chrono::milliseconds timeout);

private:
    struct io_uring_sqe* get_sqe();
    int submit_and_reap(ring_request& op, std::chrono::milliseconds timeout);

    int poll_connect(int fd, const struct sockaddr* addr, socklen_t len,
                     std::chrono::milliseconds timeout);
    int poll_wait(int fd, short events, std::chrono::milliseconds timeout);

    const logger& m_log;
    struct io_uring m_ring{};
    uint32_t m_queue_depth;
    bool m_ready{false};
};

} // namespace memcli
