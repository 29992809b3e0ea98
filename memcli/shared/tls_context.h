#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;
typedef struct ssl_session_st SSL_SESSION;

namespace memcli {

struct tls_options
{
    bool enabled{false};
    bool verify{true};
    std::string ca_path;
    std::string cert_path;
    std::string key_path;
    std::string server_name;   // SNI / hostname check; defaults to the endpoint host
};

// Client-side TLS context for memcached servers built with TLS support.
// SSL objects use BIO memory pairs; the connection moves the encrypted bytes
// through its own timed socket I/O.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // If cert/key are set, presents a client certificate (mTLS).
    bool init_client(const tls_options& opts, std::string& error);

    // Create SSL in client mode (calls SSL_set_connect_state). Offers the
    // remembered session, if any, for resumption.
    SSL* create_ssl_client(std::string_view server_name) const;

    // Queues close_notify once the handshake is done; false when there is
    // nothing to send. A session closed without it cannot be resumed.
    static bool shutdown(SSL* ssl);

    // Keeps the session of a finished connection when it can be resumed
    void remember_session(SSL* ssl);
    static bool session_reused(SSL* ssl);

    // Returns: 1 = complete, 0 = want more data, -1 = error
    static int do_handshake(SSL* ssl);

    // Read decrypted data; with peek the bytes stay queued in the session.
    // Returns bytes read, 0 = want more data, -1 = error/closed
    static int ssl_read(SSL* ssl, char* buf, int len, bool peek = false);

    // Returns bytes written, 0 = want more data, -1 = error
    static int ssl_write(SSL* ssl, const char* buf, int len);

    // Encrypted data waiting to go out on the socket
    static int bio_read_out(SSL* ssl, char* buf, int len);

    // Encrypted data received from the socket
    static int bio_write_in(SSL* ssl, const char* buf, int len);

    static bool has_pending_out(SSL* ssl);

    static void free_ssl(SSL* ssl);

    // Drains the OpenSSL error queue into a single line
    static std::string last_error();

    bool is_initialized() const { return m_ctx != nullptr; }

private:
    void forget_session();

    SSL_CTX* m_ctx = nullptr;
    SSL_SESSION* m_session = nullptr;
    bool m_verify = true;
};

} // namespace memcli
