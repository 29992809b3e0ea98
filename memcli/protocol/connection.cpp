#include "connection.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>

namespace memcli {

connection::connection(const logger& log)
    : m_log(log), m_ring(log)
{
}

connection::~connection()
{
    close();
}

void connection::close()
{
    if (m_ssl)
    {
        if (m_fd && tls_context::shutdown(m_ssl))
            send_close_notify();
        m_tls.remember_session(m_ssl);
        tls_context::free_ssl(m_ssl);
        m_ssl = nullptr;
    }
    if (m_fd)
        MEMCLI_LOG_DEBUG(m_log, "closing connection to " + m_endpoint.to_string());
    m_fd.reset();
}

// Best effort, without waiting: the stream is going away either way
void connection::send_close_notify()
{
    char buf[512];
    int n = tls_context::bio_read_out(m_ssl, buf, sizeof(buf));
    if (n <= 0)
        return;
    if (::send(m_fd.get(), buf, static_cast<size_t>(n), MSG_DONTWAIT | MSG_NOSIGNAL) != n)
        MEMCLI_LOG_DEBUG(m_log, "close_notify to " + m_endpoint.to_string() + " not sent: "
                                + std::strerror(errno));
}

bool connection::fail(error_kind kind, std::string msg, mc_error& err)
{
    close();
    MEMCLI_LOG_DEBUG(m_log, std::string(error_kind_name(kind)) + ": " + msg);
    err.set(kind, std::move(msg));
    return false;
}

bool connection::fail_io(int rc, const char* what, mc_error& err)
{
    std::string msg = std::string(what) + " " + m_endpoint.to_string() + ": ";
    if (rc == 0)
        msg += "connection closed by server";
    else if (rc == -ETIME)
        msg += "timed out after " + std::to_string(m_timeout.count()) + " ms";
    else
        msg += std::strerror(-rc);
    return fail(err_connection_closed, std::move(msg), err);
}

// ─── Lifecycle ───

bool connection::open(const endpoint& ep, std::chrono::milliseconds timeout,
                      const tls_options& tls, mc_error& err)
{
    close();
    m_endpoint = ep;
    m_timeout = timeout;

    if (!m_ring_probed)
    {
        m_ring.init();
        m_ring_probed = true;
    }

    bool ok = ep.is_local() ? connect_local(err) : connect_tcp(err);
    if (!ok)
        return false;

    if (tls.enabled && !start_tls(tls, err))
        return false;

    MEMCLI_LOG_DEBUG(m_log, "connected to " + ep.to_string()
                            + (m_ring.uses_uring() ? " (io_uring)" : " (poll)")
                            + (m_ssl ? " with TLS" : ""));
    return true;
}

bool connection::connect_local(mc_error& err)
{
    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (m_endpoint.path.size() >= sizeof(addr.sun_path))
        return fail(err_connect, "socket path too long: " + m_endpoint.path, err);
    std::memcpy(addr.sun_path, m_endpoint.path.c_str(), m_endpoint.path.size() + 1);

    scoped_fd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
        return fail(err_connect, std::string("socket: ") + std::strerror(errno), err);

    int rc = m_ring.connect(fd.get(), reinterpret_cast<struct sockaddr*>(&addr),
                            sizeof(addr), m_timeout);
    if (rc < 0)
    {
        std::string reason = rc == -ETIME ? "timed out" : std::strerror(-rc);
        return fail(err_connect, "cannot connect to " + m_endpoint.path + ": " + reason, err);
    }

    m_fd = std::move(fd);
    return true;
}

bool connection::connect_tcp(mc_error& err)
{
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port_str = std::to_string(m_endpoint.port);
    int gai = getaddrinfo(m_endpoint.host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res)
        return fail(err_connect, "cannot resolve " + m_endpoint.to_string() + ": " + gai_strerror(gai), err);

    std::string reason = "no usable address";
    for (auto* rp = res; rp; rp = rp->ai_next)
    {
        scoped_fd fd(::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol));
        if (!fd)
        {
            reason = std::strerror(errno);
            continue;
        }

        int rc = m_ring.connect(fd.get(), rp->ai_addr, rp->ai_addrlen, m_timeout);
        if (rc < 0)
        {
            reason = rc == -ETIME ? "timed out" : std::strerror(-rc);
            continue;
        }

        int opt = 1;
        setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
        m_fd = std::move(fd);
        break;
    }

    freeaddrinfo(res);

    if (!m_fd)
        return fail(err_connect, "cannot connect to " + m_endpoint.to_string() + ": " + reason, err);
    return true;
}

bool connection::start_tls(const tls_options& tls, mc_error& err)
{
    if (!m_tls.is_initialized())
    {
        std::string reason;
        if (!m_tls.init_client(tls, reason))
            return fail(err_connect, "TLS setup failed: " + reason, err);
    }

    std::string_view name = tls.server_name.empty() ? std::string_view(m_endpoint.host)
                                                    : std::string_view(tls.server_name);
    m_ssl = m_tls.create_ssl_client(name);
    if (!m_ssl)
        return fail(err_connect, "TLS session setup failed: " + tls_context::last_error(), err);

    for (;;)
    {
        int rc = tls_context::do_handshake(m_ssl);
        if (rc < 0)
            return fail(err_connect, "TLS handshake with " + m_endpoint.to_string()
                                     + " failed: " + tls_context::last_error(), err);
        if (!tls_flush(err))
        {
            err.kind = err_connect;
            return false;
        }
        if (rc == 1)
            return true;
        if (!tls_fill(err))
        {
            err.kind = err_connect;
            return false;
        }
    }
}

bool connection::tls_resumed() const
{
    return m_ssl && tls_context::session_reused(m_ssl);
}

bool connection::probe_idle()
{
    if (!m_fd)
        return false;

    struct pollfd pfd{};
    pfd.fd = m_fd.get();
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, 0);
    if (rc == 0)
        return true;
    if (rc < 0)
        return errno == EINTR;

    if (m_ssl ? idle_tls_ok() : idle_plain_ok())
        return true;
    close();
    return false;
}

bool connection::idle_plain_ok()
{
    char byte;
    ssize_t n = ::recv(m_fd.get(), &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        return true;

    MEMCLI_LOG_DEBUG(m_log, n == 0 ? "idle connection to " + m_endpoint.to_string() + " was closed by the server"
                                   : "dropping idle connection to " + m_endpoint.to_string()
                                     + ": unexpected data or socket error");
    return false;
}

bool connection::idle_tls_ok()
{
    char buf[16384];
    for (;;)
    {
        ssize_t n = ::recv(m_fd.get(), buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0)
        {
            if (tls_context::bio_write_in(m_ssl, buf, static_cast<int>(n)) != n)
            {
                MEMCLI_LOG_DEBUG(m_log, "dropping idle TLS connection to " + m_endpoint.to_string()
                                        + ": " + tls_context::last_error());
                return false;
            }
            continue;
        }
        if (n == 0)
        {
            MEMCLI_LOG_DEBUG(m_log, "idle connection to " + m_endpoint.to_string() + " was closed by the server");
            return false;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;
        MEMCLI_LOG_DEBUG(m_log, "idle connection to " + m_endpoint.to_string() + ": " + std::strerror(errno));
        return false;
    }

    // processes whatever records arrived; only application data or an alert
    // produces a result other than "want more"
    char byte;
    int got = tls_context::ssl_read(m_ssl, &byte, 1, true);
    if (got != 0)
    {
        MEMCLI_LOG_DEBUG(m_log, got > 0 ? "dropping idle TLS connection to " + m_endpoint.to_string()
                                          + ": unexpected data"
                                        : "TLS session with " + m_endpoint.to_string() + " ended while idle");
        return false;
    }

    mc_error err;
    return tls_flush(err);
}

// ─── Raw socket I/O ───

int connection::raw_recv(char* buf, size_t len, int flags)
{
    for (;;)
    {
        int rc = m_ring.recv(m_fd.get(), buf, static_cast<uint32_t>(len), flags, m_timeout);
        if (rc != -EINTR && rc != -EAGAIN)
            return rc;
    }
}

bool connection::raw_send_all(const char* data, size_t len, mc_error& err)
{
    size_t sent = 0;
    while (sent < len)
    {
        size_t chunk = std::min<size_t>(len - sent, 1u << 20);
        int rc = m_ring.send(m_fd.get(), data + sent, static_cast<uint32_t>(chunk), m_timeout);
        if (rc == -EINTR || rc == -EAGAIN)
            continue;
        if (rc <= 0)
            return fail_io(rc == 0 ? -EPIPE : rc, "write to", err);
        sent += static_cast<size_t>(rc);
    }
    return true;
}

// ─── TLS pump ───

bool connection::tls_flush(mc_error& err)
{
    char buf[16384];
    while (tls_context::has_pending_out(m_ssl))
    {
        int n = tls_context::bio_read_out(m_ssl, buf, sizeof(buf));
        if (n < 0)
            return fail(err_connection_closed, "TLS output error: " + tls_context::last_error(), err);
        if (n == 0)
            break;
        if (!raw_send_all(buf, static_cast<size_t>(n), err))
            return false;
    }
    return true;
}

bool connection::tls_fill(mc_error& err)
{
    char buf[16384];
    int n = raw_recv(buf, sizeof(buf), 0);
    if (n <= 0)
        return fail_io(n, "read from", err);
    if (tls_context::bio_write_in(m_ssl, buf, n) != n)
        return fail(err_connection_closed, "TLS input error: " + tls_context::last_error(), err);
    return true;
}

// ─── Stream I/O ───

bool connection::stream_recv(char* buf, size_t len, bool peek, int& got, mc_error& err)
{
    if (!m_ssl)
    {
        int n = raw_recv(buf, len, peek ? MSG_PEEK : 0);
        if (n <= 0)
            return fail_io(n, "read from", err);
        got = n;
        return true;
    }

    for (;;)
    {
        int n = tls_context::ssl_read(m_ssl, buf, static_cast<int>(len), peek);
        if (n > 0)
        {
            got = n;
            return true;
        }
        if (n < 0)
            return fail(err_connection_closed, "TLS session with " + m_endpoint.to_string()
                                               + " ended: " + tls_context::last_error(), err);
        if (!tls_flush(err) || !tls_fill(err))
            return false;
    }
}

bool connection::stream_send_all(const char* data, size_t len, mc_error& err)
{
    if (!m_ssl)
        return raw_send_all(data, len, err);

    size_t sent = 0;
    while (sent < len)
    {
        int chunk = static_cast<int>(std::min<size_t>(len - sent, 16384));
        int n = tls_context::ssl_write(m_ssl, data + sent, chunk);
        if (n < 0)
            return fail(err_connection_closed, "TLS write failed: " + tls_context::last_error(), err);
        if (!tls_flush(err))
            return false;
        if (n == 0)
        {
            // renegotiation data pending from the peer
            if (!tls_fill(err))
                return false;
            continue;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// ─── Public line/byte primitives ───

bool connection::send_line(std::string_view text, mc_error& err)
{
    std::string msg;
    msg.reserve(text.size() + 2);
    msg.append(text.data(), text.size());
    msg.append("\r\n", 2);
    return send_raw(msg, err);
}

bool connection::send_raw(std::string_view data, mc_error& err)
{
    if (!m_fd)
    {
        err.set(err_connection_closed, "not connected to " + m_endpoint.to_string());
        return false;
    }
    return stream_send_all(data.data(), data.size(), err);
}

bool connection::read_line(std::string& line, mc_error& err)
{
    line.clear();
    if (!m_fd)
    {
        err.set(err_connection_closed, "not connected to " + m_endpoint.to_string());
        return false;
    }

    char buf[4096];
    for (;;)
    {
        int avail = 0;
        if (!stream_recv(buf, sizeof(buf), true, avail, err))
            return false;

        auto* nl = static_cast<const char*>(std::memchr(buf, '\n', static_cast<size_t>(avail)));
        size_t take = nl ? static_cast<size_t>(nl - buf) + 1 : static_cast<size_t>(avail);

        if (line.size() + take > MAX_LINE_LENGTH + 2)
            return fail(err_framing, "reply line from " + m_endpoint.to_string()
                                     + " exceeds " + std::to_string(MAX_LINE_LENGTH) + " bytes", err);

        // consume exactly what was peeked up to the terminator
        size_t consumed = 0;
        while (consumed < take)
        {
            int got = 0;
            if (!stream_recv(buf + consumed, take - consumed, false, got, err))
                return false;
            consumed += static_cast<size_t>(got);
        }
        line.append(buf, take);

        if (nl)
        {
            line.pop_back();
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return true;
        }
    }
}

bool connection::read_exact(size_t n, std::string& out, mc_error& err)
{
    out.clear();
    if (!m_fd)
    {
        err.set(err_connection_closed, "not connected to " + m_endpoint.to_string());
        return false;
    }

    out.resize(n);
    size_t filled = 0;
    while (filled < n)
    {
        int got = 0;
        if (!stream_recv(out.data() + filled, n - filled, false, got, err))
        {
            out.clear();
            return false;
        }
        filled += static_cast<size_t>(got);
    }
    return true;
}

} // namespace memcli
