#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace memcli {

enum error_kind : uint8_t
{
    err_none              = 0,
    err_connect           = 1,   // could not establish the connection
    err_connection_closed = 2,   // link dropped mid-session (reset, EOF, timeout)
    err_framing           = 3,   // reply violated the byte/line accounting
    err_invalid_key       = 4,   // rejected before sending
    err_invalid_value     = 5,   // rejected before sending
    err_client            = 6,   // ERROR / CLIENT_ERROR <msg>
    err_server            = 7,   // SERVER_ERROR <msg>
    err_unknown_reply     = 8,   // reply token this client does not know
    err_data_source       = 9    // reconnect-and-retry gave up; see cause
};

struct mc_error
{
    error_kind kind{err_none};
    error_kind cause{err_none};
    std::string message;

    explicit operator bool() const { return kind != err_none; }

    void clear()
    {
        kind = err_none;
        cause = err_none;
        message.clear();
    }

    void set(error_kind k, std::string msg)
    {
        kind = k;
        cause = err_none;
        message = std::move(msg);
    }

    // Wraps the current error as the cause of a data source failure
    void wrap(std::string context)
    {
        cause = kind == err_data_source ? cause : kind;
        kind = err_data_source;
        if (message.empty())
            message = std::move(context);
        else
            message = std::move(context) + ": " + message;
    }
};

constexpr std::string_view error_kind_name(error_kind kind)
{
    switch (kind)
    {
        case err_none:              return "none";
        case err_connect:           return "connect error";
        case err_connection_closed: return "connection closed";
        case err_framing:           return "framing error";
        case err_invalid_key:       return "invalid key";
        case err_invalid_value:     return "invalid value";
        case err_client:            return "client error";
        case err_server:            return "server error";
        case err_unknown_reply:     return "unknown reply";
        case err_data_source:       return "data source error";
    }
    return "?";
}

} // namespace memcli
