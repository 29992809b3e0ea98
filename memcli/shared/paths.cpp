#include "paths.h"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace memcli {

namespace fs = std::filesystem;

static fs::path get_home()
{
    const char* home = std::getenv("HOME");
    if (home && home[0])
        return home;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir)
        return pw->pw_dir;

    return {};
}

memcli_paths memcli_paths::resolve()
{
    memcli_paths p;

    const char* env = std::getenv("MEMCLI_CONFIG");
    if (env && env[0])
    {
        p.config_path = env;
        p.from_env = true;
        return p;
    }

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0])
    {
        p.config_path = fs::path(xdg) / "memcli" / "config.lua";
        return p;
    }

    fs::path home = get_home();
    if (!home.empty())
        p.config_path = home / ".config" / "memcli" / "config.lua";

    return p;
}

} // namespace memcli
