#include "endpoint.h"

#include <charconv>
#include <sys/stat.h>

namespace memcli {

static bool parse_port(std::string_view sv, uint16_t& out)
{
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return false;
    if (value == 0 || value > 65535)
        return false;
    out = static_cast<uint16_t>(value);
    return true;
}

std::string endpoint::to_string() const
{
    if (is_local())
        return path;
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

bool parse_endpoint(std::string_view text, endpoint& out)
{
    out = endpoint{};

    if (text.empty())
    {
        out.host = std::string(DEFAULT_HOST);
        return true;
    }

    if (text.find('/') != std::string_view::npos)
    {
        out.path = std::string(text);
        out.host.clear();
        out.port = 0;
        return true;
    }

    std::string_view host = text;
    std::string_view port;

    if (text.front() == '[')
    {
        auto close = text.find(']');
        if (close == std::string_view::npos || close == 1)
            return false;
        host = text.substr(1, close - 1);
        auto rest = text.substr(close + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':' || rest.size() == 1)
                return false;
            port = rest.substr(1);
        }
    }
    else
    {
        auto first = text.find(':');
        auto last = text.rfind(':');
        if (first != std::string_view::npos && first == last)
        {
            host = text.substr(0, first);
            port = text.substr(first + 1);
            if (port.empty())
                return false;
        }
        // more than one colon without brackets: bare IPv6 literal
    }

    out.host = host.empty() ? std::string(DEFAULT_HOST) : std::string(host);
    if (!port.empty() && !parse_port(port, out.port))
        return false;
    return true;
}

static bool is_dotted_quad(std::string_view sv)
{
    int dots = 0;
    size_t digits = 0;
    for (char c : sv)
    {
        if (c == '.')
        {
            if (digits == 0)
                return false;
            ++dots;
            digits = 0;
        }
        else if (c >= '0' && c <= '9')
        {
            if (++digits > 3)
                return false;
        }
        else
        {
            return false;
        }
    }
    return dots == 3 && digits > 0;
}

bool looks_like_endpoint(std::string_view text)
{
    if (text.empty() || text.front() == '-' || text.front() == '\\')
        return false;

    if (text.find('/') != std::string_view::npos)
    {
        struct stat st{};
        std::string path(text);
        return stat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode);
    }

    if (text.front() == '[')
        return text.find(']') != std::string_view::npos;

    std::string_view host = text;
    auto colon = text.rfind(':');
    if (colon != std::string_view::npos)
    {
        uint16_t port;
        if (!parse_port(text.substr(colon + 1), port))
            return false;
        host = text.substr(0, colon);
        if (host.empty())
            return true;
    }

    if (host == "localhost" || is_dotted_quad(host))
        return true;

    // "cache01.example.com"; no command word contains a dot
    return colon != std::string_view::npos || host.find('.') != std::string_view::npos;
}

} // namespace memcli
