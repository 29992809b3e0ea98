#include "logging.h"
#include "hashing.h"

namespace memcli {

bool parse_log_level(std::string_view str, log_level& level)
{
    switch (fnv1a(str))
    {
        case fnv1a("debug"): level = log_debug; return true;
        case fnv1a("info"):  level = log_info;  return true;
        case fnv1a("warn"):  level = log_warn;  return true;
        case fnv1a("error"): level = log_error; return true;
        default: return false;
    }
}

} // namespace memcli
