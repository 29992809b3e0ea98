#include "dispatcher.h"
#include "stats_view.h"

#include <cstdio>

#include "../shared/parse_number.h"

namespace memcli {

using namespace codec;

dispatcher::dispatcher(data_source& ds, std::ostream& out, std::ostream& err,
                       std::string_view program)
    : m_ds(ds), m_out(out), m_err(err), m_program(program)
{
}

bool dispatcher::last_error_was_connect() const
{
    return m_last_error.kind == err_connect
        || (m_last_error.kind == err_data_source && m_last_error.cause == err_connect);
}

bool dispatcher::run(command_id id, const parsed_args& pa, size_t first)
{
    m_last_error.clear();

    switch (id)
    {
        case cmd_help:       return do_help(pa, first);
        case cmd_version:    return do_version();
        case cmd_quit:       return true;
        case cmd_display:    return do_display();
        case cmd_stats:      return do_stats("stats", "stats");
        case cmd_settings:   return do_stats("stats settings", "stats settings");
        case cmd_cachedump:  return do_cachedump(pa, first);
        case cmd_detaildump: return do_detaildump();
        case cmd_detail:     return do_detail(pa, first);
        case cmd_get:        return do_get(pa, first, false);
        case cmd_gets:       return do_get(pa, first, true);
        case cmd_set:        return do_store(verb_set, pa, first);
        case cmd_add:        return do_store(verb_add, pa, first);
        case cmd_replace:    return do_store(verb_replace, pa, first);
        case cmd_append:     return do_store(verb_append, pa, first);
        case cmd_prepend:    return do_store(verb_prepend, pa, first);
        case cmd_cas:        return do_cas(pa, first);
        case cmd_delete:     return do_delete(pa, first);
        case cmd_incr:       return do_counter(verb_incr, pa, first);
        case cmd_decr:       return do_counter(verb_decr, pa, first);
        case cmd_touch:      return do_touch(pa, first);
        case cmd_flush_all:  return do_flush_all(pa, first);
        case cmd_count:      break;
    }
    return false;
}

bool dispatcher::fail(std::string_view what, const mc_error& error)
{
    m_last_error = error;
    m_err << what << " (" << error_kind_name(error.kind) << "): " << error.message << "\n";
    return false;
}

bool dispatcher::print_lines(const lines_result& res, std::string_view what)
{
    if (!res)
        return fail(what, res.error);
    for (const auto& line : res.lines)
        m_out << line << "\n";
    return true;
}

// ─── help ───

bool dispatcher::do_help(const parsed_args& pa, size_t first)
{
    std::string_view name = pa.at(first);
    std::string body;

    command_id id;
    if (!name.empty() && resolve_command(name, id))
    {
        const command_info& ci = info_of(id);
        body += "\n[Command \"";
        body += name;
        body += "\"]\n\nSummary:\n    ";
        body += ci.summary;
        body += "\n\nAliases:\n    ";
        body += joined_aliases(id);
        body += "\n\n";
        if (!ci.description.empty())
        {
            body += ci.description;
            body += "\n";
        }
        m_out << body;
        return true;
    }

    if (!name.empty())
    {
        body += "Unknown command: ";
        body += name;
        body += "\n";
    }

    body += "\n[Available Commands]\n";
    char row[256];
    const command_info* table = command_table();
    for (size_t i = 0; i < cmd_count; ++i)
    {
        std::string aliases = joined_aliases(table[i].id);
        std::snprintf(row, sizeof(row), "%-24s    %.*s\n", aliases.c_str(),
                      static_cast<int>(table[i].summary.size()), table[i].summary.data());
        body += row;
    }
    body += "\nType \\h <command> for each.\n\n";
    m_out << body;
    return true;
}

// ─── Server information ───

bool dispatcher::do_version()
{
    version_result res = m_ds.version();
    if (!res)
        return fail("Failed to get server version", res.error);
    m_out << res.version << "\n";
    return true;
}

bool dispatcher::do_display()
{
    lines_result items = m_ds.query("stats items");
    if (!items)
        return fail("Failed to get stats items", items.error);
    lines_result slabs = m_ds.query("stats slabs");
    if (!slabs)
        return fail("Failed to get stats slabs", slabs.error);

    m_out << render_slab_table(items.lines, slabs.lines);
    return true;
}

bool dispatcher::do_stats(std::string_view title, std::string_view query)
{
    lines_result res = m_ds.query(query);
    if (!res)
        return fail("Failed to get " + std::string(title), res.error);
    m_out << render_stats_table(title, m_ds.address().to_string(), res.lines);
    return true;
}

bool dispatcher::do_cachedump(const parsed_args& pa, size_t first)
{
    if (!pa.has(first))
    {
        m_out << "No slab class specified.\n";
        return false;
    }

    uint32_t cls;
    if (!parse_uint32(pa.at(first), cls))
    {
        m_out << "Slab class must be a number - " << pa.at(first) << "\n";
        return false;
    }

    uint32_t number = 0;
    if (pa.has(first + 1) && !parse_uint32(pa.at(first + 1), number))
    {
        m_out << "NUMBER must be a number - " << pa.at(first + 1) << "\n";
        return false;
    }
    if (number == 0)
        number = static_cast<uint32_t>(DEFAULT_CACHEDUMP_SIZE);

    std::string query = "stats cachedump " + std::to_string(cls) + " " + std::to_string(number);
    return print_lines(m_ds.query(query), "Failed to dump slab class " + std::to_string(cls));
}

bool dispatcher::do_detaildump()
{
    return print_lines(m_ds.query("stats detail dump"), "Failed to get detail dump");
}

bool dispatcher::do_detail(const parsed_args& pa, size_t first)
{
    std::string_view mode = pa.at(first);
    const char* done;
    switch (fnv1a(mode))
    {
        case fnv1a("on"):  done = "Enabled"; break;
        case fnv1a("off"): done = "Disabled"; break;
        default:
            m_out << "Mode must be 'on' or 'off'!\n";
            return false;
    }

    if (!print_lines(m_ds.query("stats detail " + std::string(mode)), "Failed to switch detail mode"))
        return false;
    m_out << done << " stats collection for detail dump.\n";
    return true;
}

// ─── Items ───

bool dispatcher::do_get(const parsed_args& pa, size_t first, bool with_cas)
{
    if (!pa.has(first))
    {
        m_out << "No KEY specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    get_result res = with_cas ? m_ds.gets(key) : m_ds.get(key);
    if (!res)
        return fail("Failed to get item. KEY " + std::string(key), res.error);

    if (!res.found)
        m_out << "Not found - " << key << "\n";
    else
        m_out << res.value.describe();
    return true;
}

bool dispatcher::print_store_outcome(const status_result& res, std::string_view key,
                                     std::string_view value)
{
    if (!res)
        return fail("Failed to store item. KEY " + std::string(key) + ", VALUE " + std::string(value),
                    res.error);

    switch (res.status)
    {
        case status_stored:
            m_out << "OK\n";
            return true;
        case status_not_stored:
            m_out << "Not stored - " << key << "\n";
            return false;
        case status_exists:
            m_out << "Modified since gets - " << key << "\n";
            return false;
        case status_not_found:
            m_out << "Not found - " << key << "\n";
            return false;
        default:
            m_out << "Unexpected status " << status_name(res.status) << "\n";
            return false;
    }
}

// EXPIRE and FLAGS trailing a storage command
static bool parse_expire_flags(const parsed_args& pa, size_t idx, uint32_t& expire,
                               uint32_t& flags, std::ostream& out)
{
    if (pa.has(idx) && !parse_uint32(pa.at(idx), expire))
    {
        out << "EXPIRE must be a number - " << pa.at(idx) << "\n";
        return false;
    }
    if (pa.has(idx + 1) && !parse_uint32(pa.at(idx + 1), flags))
    {
        out << "FLAGS must be a number - " << pa.at(idx + 1) << "\n";
        return false;
    }
    return true;
}

bool dispatcher::do_store(verb kind, const parsed_args& pa, size_t first)
{
    if (!pa.has(first + 1))
    {
        m_out << "KEY or VALUE not specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    std::string_view value = pa.at(first + 1);

    uint32_t expire = 0;
    uint32_t flags = 0;
    if (kind != verb_append && kind != verb_prepend
        && !parse_expire_flags(pa, first + 2, expire, flags, m_out))
        return false;

    item it = item::build_for_set(std::string(key), std::string(value), expire, flags);
    return print_store_outcome(m_ds.store(kind, it), key, value);
}

bool dispatcher::do_cas(const parsed_args& pa, size_t first)
{
    if (!pa.has(first + 2))
    {
        m_out << "KEY, VALUE or CAS not specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    std::string_view value = pa.at(first + 1);

    uint64_t unique;
    if (!parse_uint64(pa.at(first + 2), unique))
    {
        m_out << "CAS must be a number - " << pa.at(first + 2) << "\n";
        return false;
    }

    uint32_t expire = 0;
    uint32_t flags = 0;
    if (!parse_expire_flags(pa, first + 3, expire, flags, m_out))
        return false;

    item it = item::build_for_set(std::string(key), std::string(value), expire, flags);
    it.set_cas(unique);
    return print_store_outcome(m_ds.cas(it), key, value);
}

bool dispatcher::do_delete(const parsed_args& pa, size_t first)
{
    if (!pa.has(first))
    {
        m_out << "No KEY specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    status_result res = m_ds.remove(key);
    if (!res)
        return fail("Failed to delete item. KEY " + std::string(key), res.error);

    if (res.status != status_deleted)
    {
        m_out << "Not found - " << key << "\n";
        return false;
    }
    m_out << "OK\n";
    return true;
}

bool dispatcher::do_counter(verb kind, const parsed_args& pa, size_t first)
{
    if (!pa.has(first))
    {
        m_out << "No KEY specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    uint64_t delta = 1;
    if (pa.has(first + 1) && !parse_uint64(pa.at(first + 1), delta))
    {
        m_out << "DELTA must be a number - " << pa.at(first + 1) << "\n";
        return false;
    }

    counter_result res = kind == verb_incr ? m_ds.incr(key, delta) : m_ds.decr(key, delta);
    if (!res)
        return fail("Failed to " + std::string(verb_name(kind)) + " item. KEY " + std::string(key),
                    res.error);

    if (!res.found)
    {
        m_out << "Not found - " << key << "\n";
        return false;
    }
    m_out << res.value << "\n";
    return true;
}

bool dispatcher::do_touch(const parsed_args& pa, size_t first)
{
    if (!pa.has(first + 1))
    {
        m_out << "KEY or EXPIRE not specified.\n";
        return false;
    }

    std::string_view key = pa.at(first);
    uint32_t expire;
    if (!parse_uint32(pa.at(first + 1), expire))
    {
        m_out << "EXPIRE must be a number - " << pa.at(first + 1) << "\n";
        return false;
    }

    status_result res = m_ds.touch(key, expire);
    if (!res)
        return fail("Failed to touch item. KEY " + std::string(key), res.error);

    if (res.status != status_touched)
    {
        m_out << "Not found - " << key << "\n";
        return false;
    }
    m_out << "OK\n";
    return true;
}

bool dispatcher::do_flush_all(const parsed_args& pa, size_t first)
{
    uint32_t delay = 0;
    if (pa.has(first) && !parse_uint32(pa.at(first), delay))
    {
        m_out << "DELAY must be a number - " << pa.at(first) << "\n";
        return false;
    }

    status_result res = m_ds.flush_all(delay);
    if (!res)
        return fail("Failed to flush all items", res.error);
    m_out << "OK\n";
    return true;
}

} // namespace memcli
