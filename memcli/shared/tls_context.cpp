#include "tls_context.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/x509v3.h>

namespace memcli {

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    forget_session();
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

void tls_context::forget_session()
{
    if (m_session)
    {
        SSL_SESSION_free(m_session);
        m_session = nullptr;
    }
}

bool tls_context::init_client(const tls_options& opts, std::string& error)
{
    forget_session();
    if (m_ctx)
    {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
    {
        error = "failed to create SSL context: " + last_error();
        return false;
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);

    // sessions are kept by remember_session, not by the internal cache
    SSL_CTX_set_session_cache_mode(m_ctx, SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);

    long opts_mask = SSL_CTX_get_options(m_ctx);
#if defined(SSL_OP_NO_RENEGOTIATION)
    opts_mask |= SSL_OP_NO_RENEGOTIATION;
#endif
    SSL_CTX_set_options(m_ctx, opts_mask);
    SSL_CTX_set_mode(m_ctx, SSL_MODE_AUTO_RETRY | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    m_verify = opts.verify;
    if (opts.verify)
    {
        int rc = opts.ca_path.empty()
            ? SSL_CTX_set_default_verify_paths(m_ctx)
            : SSL_CTX_load_verify_locations(m_ctx, opts.ca_path.c_str(), nullptr);
        if (rc <= 0)
        {
            error = "failed to load CA file: " + (opts.ca_path.empty() ? std::string("(system default)") : opts.ca_path);
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, nullptr);
    }
    else
    {
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);
    }

    if (!opts.cert_path.empty() || !opts.key_path.empty())
    {
        if (opts.cert_path.empty() || opts.key_path.empty())
        {
            error = "client certificate and key must be given together";
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (SSL_CTX_use_certificate_file(m_ctx, opts.cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            error = "failed to load client certificate: " + opts.cert_path;
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (SSL_CTX_use_PrivateKey_file(m_ctx, opts.key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            error = "failed to load client key: " + opts.key_path;
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (!SSL_CTX_check_private_key(m_ctx))
        {
            error = "client key does not match certificate";
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }

    return true;
}

SSL* tls_context::create_ssl_client(std::string_view server_name) const
{
    if (!m_ctx)
        return nullptr;

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
        return nullptr;

    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio)
    {
        BIO_free(rbio);
        BIO_free(wbio);
        SSL_free(ssl);
        return nullptr;
    }

    BIO_set_mem_eof_return(rbio, -1);
    BIO_set_mem_eof_return(wbio, -1);
    SSL_set_bio(ssl, rbio, wbio);

    if (!server_name.empty())
    {
        std::string name(server_name);
        SSL_set_tlsext_host_name(ssl, name.c_str());
        if (m_verify)
            SSL_set1_host(ssl, name.c_str());
    }

    if (m_session)
        SSL_set_session(ssl, m_session);

    SSL_set_connect_state(ssl);
    return ssl;
}

bool tls_context::shutdown(SSL* ssl)
{
    if (!SSL_is_init_finished(ssl))
        return false;
    return SSL_shutdown(ssl) >= 0;
}

void tls_context::remember_session(SSL* ssl)
{
    SSL_SESSION* session = SSL_get1_session(ssl);
    if (!session)
        return;
    if (!SSL_SESSION_is_resumable(session))
    {
        SSL_SESSION_free(session);
        return;
    }
    forget_session();
    m_session = session;
}

bool tls_context::session_reused(SSL* ssl)
{
    return SSL_session_reused(ssl) == 1;
}

int tls_context::do_handshake(SSL* ssl)
{
    int ret = SSL_do_handshake(ssl);
    if (ret == 1)
        return 1;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::ssl_read(SSL* ssl, char* buf, int len, bool peek)
{
    int ret = peek ? SSL_peek(ssl, buf, len) : SSL_read(ssl, buf, len);
    if (ret > 0)
        return ret;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::ssl_write(SSL* ssl, const char* buf, int len)
{
    int ret = SSL_write(ssl, buf, len);
    if (ret > 0)
        return ret;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::bio_read_out(SSL* ssl, char* buf, int len)
{
    BIO* wbio = SSL_get_wbio(ssl);
    if (!wbio)
        return -1;

    int ret = BIO_read(wbio, buf, len);
    if (ret > 0)
        return ret;
    if (BIO_should_retry(wbio))
        return 0;
    return -1;
}

int tls_context::bio_write_in(SSL* ssl, const char* buf, int len)
{
    BIO* rbio = SSL_get_rbio(ssl);
    if (!rbio)
        return -1;

    int ret = BIO_write(rbio, buf, len);
    if (ret > 0)
        return ret;
    if (BIO_should_retry(rbio))
        return 0;
    return -1;
}

bool tls_context::has_pending_out(SSL* ssl)
{
    BIO* wbio = SSL_get_wbio(ssl);
    return wbio && BIO_ctrl_pending(wbio) > 0;
}

void tls_context::free_ssl(SSL* ssl)
{
    if (ssl)
        SSL_free(ssl);
}

std::string tls_context::last_error()
{
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0)
    {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty())
            out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown TLS error" : out;
}

} // namespace memcli
