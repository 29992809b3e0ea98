#include "commands.h"
#include "../shared/hashing.h"

namespace memcli {

static const command_info k_commands[cmd_count] = {
    { cmd_help, "help", "\\h", "Show help (this)", "" },
    { cmd_version, "version", "\\v", "Show server version", "" },
    { cmd_quit, "quit", "\\q exit", "Exit", "" },
    { cmd_display, "display", "\\d", "Display slabs info", "" },
    { cmd_stats, "stats", "\\s", "Show stats", "" },
    { cmd_settings, "settings", "\\c config", "Show settings", "" },
    { cmd_cachedump, "cachedump", "\\cd dump", "Show cachedump of specified slab",
R"(Usage:
    > cachedump <CLASS> <NUMBER>
    > cachedump 1 10
    > cachedump 3     # default <NUMBER>
)" },
    { cmd_detaildump, "detaildump", "\\dd", "Show detail dump",
R"(Description:
    Report statistics about data access using KEY prefix. The default separator
    for prefix is ':'.
    If you have not enabled reporting at Memcached start-up, run "detail on".
    See man memcached(1) for details.
)" },
    { cmd_detail, "detail", "", "Enable/Disable detail dump",
R"(Usage:
    > detail on
    > detail off

Description:
    See "\h detaildump"
)" },
    { cmd_get, "get", "", "Get data of KEY",
R"(Usage:
    > get <KEY>
)" },
    { cmd_gets, "gets", "", "Get data of KEY with its CAS token",
R"(Usage:
    > gets <KEY>

Description:
    Pass the printed cas value to "cas" to update the KEY only if nobody
    else changed it in between.
)" },
    { cmd_set, "set", "", "Set data with KEY, VALUE",
R"(Usage:
    > set <KEY> <VALUE> [<EXPIRE> [<FLAGS>]]
    > set mykey1 MyValue1
    > set mykey2 MyValue2 0     # Never expires. Default
    > set mykey3 MyValue3 120 1
)" },
    { cmd_add, "add", "", "Add data with KEY, VALUE only if KEY is absent",
R"(Usage:
    > add <KEY> <VALUE> [<EXPIRE> [<FLAGS>]]
)" },
    { cmd_replace, "replace", "", "Replace data of KEY only if KEY exists",
R"(Usage:
    > replace <KEY> <VALUE> [<EXPIRE> [<FLAGS>]]
)" },
    { cmd_append, "append", "", "Append VALUE to data of KEY",
R"(Usage:
    > append <KEY> <VALUE>
)" },
    { cmd_prepend, "prepend", "", "Prepend VALUE to data of KEY",
R"(Usage:
    > prepend <KEY> <VALUE>
)" },
    { cmd_cas, "cas", "", "Set data of KEY if CAS still matches",
R"(Usage:
    > cas <KEY> <VALUE> <CAS> [<EXPIRE> [<FLAGS>]]
    > gets mykey1
    > cas mykey1 NewValue 1234
)" },
    { cmd_delete, "delete", "", "Delete data of KEY",
R"(Usage:
    > delete <KEY>
)" },
    { cmd_incr, "incr", "", "Increment numeric data of KEY",
R"(Usage:
    > incr <KEY> [<DELTA>]     # default <DELTA> is 1
)" },
    { cmd_decr, "decr", "", "Decrement numeric data of KEY",
R"(Usage:
    > decr <KEY> [<DELTA>]     # default <DELTA> is 1
)" },
    { cmd_touch, "touch", "", "Update expiration of KEY",
R"(Usage:
    > touch <KEY> <EXPIRE>
)" },
    { cmd_flush_all, "flush_all", "", "Invalidate all data",
R"(Usage:
    > flush_all [<DELAY>]
)" },
};

const command_info* command_table()
{
    return k_commands;
}

const command_info& info_of(command_id id)
{
    return k_commands[id < cmd_count ? id : cmd_help];
}

bool resolve_command(std::string_view word, command_id& out)
{
    switch (fnv1a(word))
    {
        case fnv1a("help"):
        case fnv1a("\\h"):        out = cmd_help; return true;
        case fnv1a("version"):
        case fnv1a("\\v"):        out = cmd_version; return true;
        case fnv1a("quit"):
        case fnv1a("\\q"):
        case fnv1a("exit"):       out = cmd_quit; return true;
        case fnv1a("display"):
        case fnv1a("\\d"):        out = cmd_display; return true;
        case fnv1a("stats"):
        case fnv1a("\\s"):        out = cmd_stats; return true;
        case fnv1a("settings"):
        case fnv1a("\\c"):
        case fnv1a("config"):     out = cmd_settings; return true;
        case fnv1a("cachedump"):
        case fnv1a("\\cd"):
        case fnv1a("dump"):       out = cmd_cachedump; return true;
        case fnv1a("detaildump"):
        case fnv1a("\\dd"):       out = cmd_detaildump; return true;
        case fnv1a("detail"):     out = cmd_detail; return true;
        case fnv1a("get"):        out = cmd_get; return true;
        case fnv1a("gets"):       out = cmd_gets; return true;
        case fnv1a("set"):        out = cmd_set; return true;
        case fnv1a("add"):        out = cmd_add; return true;
        case fnv1a("replace"):    out = cmd_replace; return true;
        case fnv1a("append"):     out = cmd_append; return true;
        case fnv1a("prepend"):    out = cmd_prepend; return true;
        case fnv1a("cas"):        out = cmd_cas; return true;
        case fnv1a("delete"):     out = cmd_delete; return true;
        case fnv1a("incr"):       out = cmd_incr; return true;
        case fnv1a("decr"):       out = cmd_decr; return true;
        case fnv1a("touch"):      out = cmd_touch; return true;
        case fnv1a("flush_all"):  out = cmd_flush_all; return true;
        default:                  return false;
    }
}

std::vector<std::string_view> sorted_aliases(command_id id)
{
    const command_info& ci = info_of(id);

    std::vector<std::string_view> aliases;
    std::string_view rest = ci.aliases;
    while (!rest.empty())
    {
        size_t sp = rest.find(' ');
        aliases.push_back(rest.substr(0, sp));
        if (sp == std::string_view::npos)
            break;
        rest.remove_prefix(sp + 1);
    }

    if (aliases.empty())
        return { ci.name };

    std::vector<std::string_view> out;
    out.push_back(aliases.front());
    out.push_back(ci.name);
    out.insert(out.end(), aliases.begin() + 1, aliases.end());
    return out;
}

std::string joined_aliases(command_id id)
{
    std::string out;
    for (auto a : sorted_aliases(id))
    {
        if (!out.empty())
            out += ", ";
        out += a;
    }
    return out;
}

} // namespace memcli
