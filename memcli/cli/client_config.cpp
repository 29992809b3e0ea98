#include "client_config.h"

#include <cmath>
#include <fstream>
#include <sol/sol.hpp>

#include "../shared/parse_number.h"

namespace memcli {

static constexpr double MAX_TIMEOUT_SECONDS = 1e9;

static bool read_size(const sol::object& obj, size_t& out)
{
    switch (obj.get_type())
    {
        case sol::type::number:
        {
            double n = obj.as<double>();
            if (n < 0 || n != std::floor(n))
                return false;
            out = static_cast<size_t>(n);
            return true;
        }
        case sol::type::string:
            return parse_size_suffix(obj.as<std::string>(), out);
        default:
            return false;
    }
}

static bool read_tls(const sol::table& t, tls_options& tls, std::string& error)
{
    sol::optional<bool> enabled = t["enabled"];
    if (enabled)
        tls.enabled = *enabled;
    else
        tls.enabled = true;   // a tls table on its own turns TLS on

    sol::optional<bool> verify = t["verify"];
    if (verify)
        tls.verify = *verify;

    sol::optional<std::string> ca = t["ca"];
    if (ca)
        tls.ca_path = *ca;
    sol::optional<std::string> cert = t["cert"];
    if (cert)
        tls.cert_path = *cert;
    sol::optional<std::string> key = t["key"];
    if (key)
        tls.key_path = *key;
    sol::optional<std::string> server_name = t["server_name"];
    if (server_name)
        tls.server_name = *server_name;

    if (tls.cert_path.empty() != tls.key_path.empty())
    {
        error = "tls.cert and tls.key must be given together";
        return false;
    }
    return true;
}

bool load_client_config(const std::string& path, bool required,
                        client_settings& settings, std::string& error)
{
    std::ifstream check(path);
    if (!check.good())
    {
        if (!required)
            return true;
        error = "cannot read config file " + path;
        return false;
    }
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table);

    auto result = lua.safe_script_file(path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        error = "error loading " + path + ": " + err.what();
        return false;
    }

    sol::optional<sol::table> config = lua["config"];
    if (!config)
        return true;

    sol::optional<std::string> addr = (*config)["addr"];
    if (addr)
        settings.addr = *addr;

    sol::optional<double> timeout = (*config)["timeout"];
    if (timeout)
    {
        if (!std::isfinite(*timeout) || *timeout < 0 || *timeout > MAX_TIMEOUT_SECONDS)
        {
            error = path + ": timeout must be a number of seconds between 0 and "
                    + std::to_string(static_cast<uint64_t>(MAX_TIMEOUT_SECONDS));
            return false;
        }
        settings.timeout_ms = static_cast<uint64_t>(std::llround(*timeout * 1000.0));
    }

    sol::optional<bool> debug = (*config)["debug"];
    if (debug && *debug)
        settings.level = log_debug;

    sol::optional<std::string> ll = (*config)["log_level"];
    if (ll)
    {
        log_level level;
        if (!parse_log_level(*ll, level))
        {
            error = path + ": unknown log_level '" + *ll + "'";
            return false;
        }
        settings.level = level;
    }

    sol::object max_value = (*config)["max_value_size"];
    if (max_value.valid() && max_value.get_type() != sol::type::lua_nil)
    {
        size_t size;
        if (!read_size(max_value, size) || size == 0)
        {
            error = path + ": max_value_size must be a positive size such as 1048576 or \"1M\"";
            return false;
        }
        settings.max_value_size = size;
    }

    sol::optional<sol::table> tls = (*config)["tls"];
    if (tls && !read_tls(*tls, settings.tls, error))
    {
        error = path + ": " + error;
        return false;
    }

    return true;
}

} // namespace memcli
