#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "endpoint.h"
#include "mc_error.h"
#include "../shared/io_ring.h"
#include "../shared/logging.h"
#include "../shared/scoped_fd.h"
#include "../shared/tls_context.h"

namespace memcli {

// One stream to one memcached endpoint. Either fully open or fully closed:
// every I/O failure closes the stream before the error is reported, and a
// closed connection must be reopened before it can be used again.
//
// Reads never run ahead of the caller: lines are located with MSG_PEEK (or
// SSL_peek) and only the bytes up to and including the terminator are
// consumed, so a reply that was abandoned half way cannot leak into the next.
class connection
{
public:
    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

    explicit connection(const logger& log);
    ~connection();

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    // Timeout applies to the connect and to every later read or write.
    // A zero timeout waits forever.
    bool open(const endpoint& ep, std::chrono::milliseconds timeout,
              const tls_options& tls, mc_error& err);
    void close();

    bool is_open() const { return static_cast<bool>(m_fd); }
    bool is_tls() const { return m_ssl != nullptr; }
    // The current TLS session was resumed from the previous connection
    bool tls_resumed() const;

    // Zero-wait check of an idle connection. Closes it and returns false when
    // the peer hung up or sent bytes nobody asked for. On TLS, records that
    // carry no application data (session tickets, key updates) are absorbed.
    bool probe_idle();

    // Appends CRLF
    bool send_line(std::string_view text, mc_error& err);
    // Sends the bytes as they are (used for pre-encoded commands)
    bool send_raw(std::string_view data, mc_error& err);

    // Strips the CRLF (or a bare LF)
    bool read_line(std::string& line, mc_error& err);
    bool read_exact(size_t n, std::string& out, mc_error& err);

    const endpoint& address() const { return m_endpoint; }
    std::chrono::milliseconds timeout() const { return m_timeout; }

private:
    bool connect_tcp(mc_error& err);
    bool connect_local(mc_error& err);
    bool start_tls(const tls_options& tls, mc_error& err);

    // Raw socket I/O: > 0 bytes, 0 on orderly EOF, -errno otherwise
    int raw_recv(char* buf, size_t len, int flags);
    bool raw_send_all(const char* data, size_t len, mc_error& err);

    // Stream I/O over the socket or the TLS session; > 0 bytes or false
    bool stream_recv(char* buf, size_t len, bool peek, int& got, mc_error& err);
    bool stream_send_all(const char* data, size_t len, mc_error& err);

    bool tls_flush(mc_error& err);
    bool tls_fill(mc_error& err);

    void send_close_notify();
    bool idle_plain_ok();
    bool idle_tls_ok();

    bool fail(error_kind kind, std::string msg, mc_error& err);
    bool fail_io(int rc, const char* what, mc_error& err);

    const logger& m_log;
    io_ring m_ring;
    bool m_ring_probed{false};
    scoped_fd m_fd;
    endpoint m_endpoint;
    std::chrono::milliseconds m_timeout{0};
    tls_context m_tls;
    SSL* m_ssl{nullptr};
};

} // namespace memcli
