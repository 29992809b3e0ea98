#pragma once
#include <filesystem>
#include <string>

namespace memcli {

struct memcli_paths
{
    std::filesystem::path config_path;   // client config.lua, may not exist
    bool from_env = false;               // taken from $MEMCLI_CONFIG

    static memcli_paths resolve();
};

} // namespace memcli
