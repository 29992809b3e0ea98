#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace memcli {

constexpr uint16_t DEFAULT_PORT = 11211;
constexpr std::string_view DEFAULT_HOST = "127.0.0.1";

// A memcached server address: TCP host/port, or a local (Unix) socket path.
struct endpoint
{
    std::string host;
    uint16_t port{DEFAULT_PORT};
    std::string path;

    bool is_local() const { return !path.empty(); }

    // "host:port", "[v6]:port" or the socket path
    std::string to_string() const;
};

// Accepts "", "host", "host:port", ":port", "[v6]", "[v6]:port", bare IPv6
// literals and paths (anything containing '/'). Missing parts take the
// defaults above.
bool parse_endpoint(std::string_view text, endpoint& out);

// True when a leading command-line word should be read as an address rather
// than as a command.
bool looks_like_endpoint(std::string_view text);

} // namespace memcli
