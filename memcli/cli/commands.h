#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace memcli {

// Every command the front end knows. Each one has exactly one handler in
// the dispatcher.
enum command_id : uint8_t
{
    cmd_help = 0,
    cmd_version,
    cmd_quit,
    cmd_display,
    cmd_stats,
    cmd_settings,
    cmd_cachedump,
    cmd_detaildump,
    cmd_detail,
    cmd_get,
    cmd_gets,
    cmd_set,
    cmd_add,
    cmd_replace,
    cmd_append,
    cmd_prepend,
    cmd_cas,
    cmd_delete,
    cmd_incr,
    cmd_decr,
    cmd_touch,
    cmd_flush_all,
    cmd_count
};

struct command_info
{
    command_id id;
    std::string_view name;
    std::string_view aliases;       // space separated, preferred alias first
    std::string_view summary;
    std::string_view description;   // optional usage block for "help <cmd>"
};

constexpr size_t DEFAULT_CACHEDUMP_SIZE = 20;

// Command table in help order
const command_info* command_table();
const command_info& info_of(command_id id);

// Name or alias -> command
bool resolve_command(std::string_view word, command_id& out);

// Preferred alias, then the name, then the other aliases
std::vector<std::string_view> sorted_aliases(command_id id);
std::string joined_aliases(command_id id);

} // namespace memcli
