#include "flag_handlers.h"

#include "../protocol/endpoint.h"
#include "../shared/parse_number.h"

namespace memcli {

static bool take_value(const parsed_args& pa, size_t& i, std::string_view flag,
                       std::string_view what, std::string& out, std::ostream& err)
{
    if (i + 1 >= pa.count)
    {
        err << flag << " requires " << what << "\n";
        return false;
    }
    out = pa.args[++i];
    return true;
}

// Returns 0 = handled, 1 = usage error, -1 = not an option
static int parse_flag(const parsed_args& pa, size_t& i, cli_flags& flags, std::ostream& err)
{
    std::string value;

    switch (pa.hashes[i])
    {
        case fnv1a("-a"):
        case fnv1a("--addr"):
            if (!take_value(pa, i, pa.args[i], "an address", value, err))
                return 1;
            flags.addr = value;
            return 0;

        case fnv1a("-t"):
        case fnv1a("--timeout"):
        {
            if (!take_value(pa, i, pa.args[i], "a number of seconds", value, err))
                return 1;
            uint64_t ms;
            if (!parse_seconds_ms(value, ms))
            {
                err << "invalid timeout: " << value << "\n";
                return 1;
            }
            flags.timeout_ms = ms;
            return 0;
        }

        case fnv1a("-d"):
        case fnv1a("--debug"):
            flags.debug = true;
            return 0;

        case fnv1a("-c"):
        case fnv1a("--config"):
            if (!take_value(pa, i, pa.args[i], "a Lua config path", value, err))
                return 1;
            flags.config_path = value;
            return 0;

        case fnv1a("--tls"):
            flags.tls = true;
            return 0;

        case fnv1a("--tls-no-verify"):
            flags.tls = true;
            flags.tls_no_verify = true;
            return 0;

        case fnv1a("--tls-ca"):
            if (!take_value(pa, i, pa.args[i], "a CA file", value, err))
                return 1;
            flags.tls = true;
            flags.tls_ca = value;
            return 0;

        case fnv1a("--tls-cert"):
            if (!take_value(pa, i, pa.args[i], "a certificate file", value, err))
                return 1;
            flags.tls = true;
            flags.tls_cert = value;
            return 0;

        case fnv1a("--tls-key"):
            if (!take_value(pa, i, pa.args[i], "a key file", value, err))
                return 1;
            flags.tls = true;
            flags.tls_key = value;
            return 0;

        case fnv1a("-h"):
        case fnv1a("--help"):
            flags.show_help = true;
            return 0;

        case fnv1a("-V"):
        case fnv1a("--version"):
            flags.show_version = true;
            return 0;

        default:
            return -1;
    }
}

int parse_cli_flags(const parsed_args& pa, cli_flags& flags, std::ostream& err)
{
    if (pa.truncated)
    {
        err << "too many arguments (at most " << MAX_ARGS << ")\n";
        return 1;
    }

    size_t i = 0;
    if (pa.count > 0 && looks_like_endpoint(pa.args[0]))
    {
        flags.addr = std::string(pa.args[0]);
        i = 1;
    }

    for (; i < pa.count; ++i)
    {
        std::string_view arg = pa.args[i];
        if (arg == "--")
        {
            ++i;
            break;
        }

        int rc = parse_flag(pa, i, flags, err);
        if (rc == 1)
            return 1;
        if (rc == 0)
            continue;

        if (arg.size() > 1 && arg[0] == '-')
        {
            err << "unknown option: " << arg << "\n";
            return 1;
        }
        break;
    }

    flags.command_index = i;

    if (flags.addr)
    {
        endpoint ep;
        if (!parse_endpoint(*flags.addr, ep))
        {
            err << "invalid address: " << *flags.addr << "\n";
            return 1;
        }
    }
    if (flags.tls_cert.has_value() != flags.tls_key.has_value())
    {
        err << "--tls-cert and --tls-key must be given together\n";
        return 1;
    }
    return 0;
}

void apply_cli_flags(const cli_flags& flags, client_settings& settings)
{
    if (flags.addr)
        settings.addr = *flags.addr;
    if (flags.timeout_ms)
        settings.timeout_ms = *flags.timeout_ms;
    if (flags.debug)
        settings.level = log_debug;

    if (flags.tls)
        settings.tls.enabled = true;
    if (flags.tls_no_verify)
        settings.tls.verify = false;
    if (flags.tls_ca)
        settings.tls.ca_path = *flags.tls_ca;
    if (flags.tls_cert)
        settings.tls.cert_path = *flags.tls_cert;
    if (flags.tls_key)
        settings.tls.key_path = *flags.tls_key;
}

} // namespace memcli
