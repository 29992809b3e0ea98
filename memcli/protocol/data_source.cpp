#include "data_source.h"

#include <algorithm>

namespace memcli {

using namespace codec;

data_source::data_source(data_source_options opts, const logger& log)
    : m_opts(std::move(opts)), m_log(log), m_conn(log)
{
}

bool data_source::open(mc_error& err)
{
    return m_conn.open(m_opts.address, m_opts.timeout, m_opts.tls, err);
}

void data_source::close()
{
    m_conn.close();
}

// ─── Session policy ───

bool data_source::ensure_connected(mc_error& err)
{
    if (m_conn.is_open() && m_conn.probe_idle())
        return true;
    return open(err);
}

bool data_source::reconnect(mc_error& err)
{
    MEMCLI_LOG_INFO(m_log, "reconnecting to " + m_opts.address.to_string());
    mc_error why;
    if (open(why))
        return true;
    err = std::move(why);
    err.wrap("reconnect to " + m_opts.address.to_string() + " failed");
    return false;
}

bool data_source::attempt(const std::string& request, const reply_reader& read_reply, mc_error& err)
{
    m_request_written = false;
    if (!m_conn.send_raw(request, err))
        return false;
    m_request_written = true;
    return read_reply(err);
}

bool data_source::execute(std::string_view name, const std::string& request, bool idempotent,
                          const reply_reader& read_reply, mc_error& err)
{
    err.clear();
    if (!ensure_connected(err))
        return false;

    MEMCLI_LOG_DEBUG(m_log, "-> " + std::string(name) + " (" + std::to_string(request.size()) + " bytes)");

    if (attempt(request, read_reply, err))
        return true;
    if (err.kind != err_connection_closed)
        return false;

    MEMCLI_LOG_WARN(m_log, err.message);
    bool retry = idempotent || !m_request_written;

    mc_error lost = err;
    if (!reconnect(err))
        return false;

    if (!retry)
    {
        err = std::move(lost);
        err.wrap(std::string(name) + " may have been applied, the connection dropped before the reply");
        return false;
    }

    err.clear();
    if (attempt(request, read_reply, err))
        return true;
    if (err.kind == err_connection_closed)
        err.wrap("retry of " + std::string(name) + " failed");
    return false;
}

bool data_source::unexpected(std::string_view name, const std::string& line, mc_error& err)
{
    // the stream can no longer be trusted to line up with our requests
    m_conn.close();
    err.set(err_unknown_reply, "unexpected reply to " + std::string(name) + ": " + line);
    return false;
}

bool data_source::read_status(std::string_view name, std::initializer_list<reply_status> accepted,
                              reply_status& status, mc_error& err)
{
    std::string line;
    if (!m_conn.read_line(line, err))
        return false;

    status_reply reply = decode_status(line);
    if (status_to_error(reply, err))
        return false;
    if (std::find(accepted.begin(), accepted.end(), reply.status) == accepted.end())
        return unexpected(name, line, err);

    status = reply.status;
    return true;
}

// ─── Operations ───

lines_result data_source::query(std::string_view raw_command)
{
    lines_result res;
    if (raw_command.empty() || raw_command.find_first_of("\r\n") != std::string_view::npos)
    {
        res.error.set(err_invalid_value, "command must be a single non-empty line");
        return res;
    }

    command cmd;
    cmd.text = raw_command;
    std::string request = encode(cmd);

    execute(raw_command, request, true, [&](mc_error& err)
    {
        return read_block(m_conn, res.lines, res.terminator, err);
    }, res.error);
    return res;
}

get_result data_source::retrieve(verb kind, std::string_view key)
{
    get_result res;
    if (!validate_key(key, res.error))
        return res;

    std::string request = encode(make_retrieval(kind, std::string(key)));

    execute(verb_name(kind), request, true, [&](mc_error& err)
    {
        value_header header;
        std::string data;
        switch (decode_value_block(m_conn, key, header, data, err))
        {
            case block_found:
                if (!item::from_get_reply(header, std::move(data), res.value, err))
                    return false;
                res.found = true;
                return true;
            case block_not_found:
                res.found = false;
                return true;
            default:
                return false;
        }
    }, res.error);
    return res;
}

get_result data_source::get(std::string_view key)
{
    return retrieve(verb_get, key);
}

get_result data_source::gets(std::string_view key)
{
    return retrieve(verb_gets, key);
}

status_result data_source::store(verb kind, const item& it)
{
    status_result res;
    if (!is_storage(kind))
    {
        res.error.set(err_invalid_value, std::string(verb_name(kind)) + " is not a storage command");
        return res;
    }
    if (!validate_key(it.key(), res.error))
        return res;
    if (it.length() > m_opts.max_value_size)
    {
        res.error.set(err_invalid_value, "value is " + std::to_string(it.length())
                                         + " bytes, limit is " + std::to_string(m_opts.max_value_size));
        return res;
    }
    if (kind == verb_cas && !it.cas())
    {
        res.error.set(err_invalid_value, "cas needs the token returned by gets");
        return res;
    }

    std::string request = encode(make_storage(kind, it));

    execute(verb_name(kind), request, false, [&](mc_error& err)
    {
        return read_status(verb_name(kind),
                           {status_stored, status_not_stored, status_exists, status_not_found},
                           res.status, err);
    }, res.error);
    return res;
}

status_result data_source::set(std::string key, std::string value, uint32_t flags, uint32_t expire)
{
    return store(verb_set, item::build_for_set(std::move(key), std::move(value), expire, flags));
}

status_result data_source::add(std::string key, std::string value, uint32_t flags, uint32_t expire)
{
    return store(verb_add, item::build_for_set(std::move(key), std::move(value), expire, flags));
}

status_result data_source::replace(std::string key, std::string value, uint32_t flags, uint32_t expire)
{
    return store(verb_replace, item::build_for_set(std::move(key), std::move(value), expire, flags));
}

status_result data_source::append(std::string key, std::string value)
{
    return store(verb_append, item::build_for_set(std::move(key), std::move(value)));
}

status_result data_source::prepend(std::string key, std::string value)
{
    return store(verb_prepend, item::build_for_set(std::move(key), std::move(value)));
}

status_result data_source::cas(const item& it)
{
    return store(verb_cas, it);
}

status_result data_source::remove(std::string_view key)
{
    status_result res;
    if (!validate_key(key, res.error))
        return res;

    std::string request = encode(make_delete(std::string(key)));

    execute("delete", request, false, [&](mc_error& err)
    {
        return read_status("delete", {status_deleted, status_not_found}, res.status, err);
    }, res.error);
    return res;
}

counter_result data_source::counter(verb kind, std::string_view key, uint64_t delta)
{
    counter_result res;
    if (!validate_key(key, res.error))
        return res;

    std::string request = encode(make_counter(kind, std::string(key), delta));

    execute(verb_name(kind), request, false, [&](mc_error& err)
    {
        std::string line;
        if (!m_conn.read_line(line, err))
            return false;
        if (decode_counter(line, res.value))
        {
            res.found = true;
            return true;
        }

        status_reply reply = decode_status(line);
        if (reply.status == status_not_found)
        {
            res.found = false;
            return true;
        }
        if (status_to_error(reply, err))
            return false;
        return unexpected(verb_name(kind), line, err);
    }, res.error);
    return res;
}

counter_result data_source::incr(std::string_view key, uint64_t delta)
{
    return counter(verb_incr, key, delta);
}

counter_result data_source::decr(std::string_view key, uint64_t delta)
{
    return counter(verb_decr, key, delta);
}

status_result data_source::touch(std::string_view key, uint32_t expire)
{
    status_result res;
    if (!validate_key(key, res.error))
        return res;

    std::string request = encode(make_touch(std::string(key), expire));

    execute("touch", request, true, [&](mc_error& err)
    {
        return read_status("touch", {status_touched, status_not_found}, res.status, err);
    }, res.error);
    return res;
}

status_result data_source::flush_all(uint32_t delay)
{
    status_result res;

    command cmd;
    cmd.kind = verb_flush_all;
    cmd.number = delay;
    std::string request = encode(cmd);

    execute("flush_all", request, false, [&](mc_error& err)
    {
        return read_status("flush_all", {status_ok}, res.status, err);
    }, res.error);
    return res;
}

version_result data_source::version()
{
    version_result res;

    command cmd;
    cmd.kind = verb_version;
    std::string request = encode(cmd);

    execute("version", request, true, [&](mc_error& err)
    {
        std::string line;
        if (!m_conn.read_line(line, err))
            return false;
        if (decode_version(line, res.version))
            return true;
        if (status_to_error(decode_status(line), err))
            return false;
        return unexpected("version", line, err);
    }, res.error);
    return res;
}

} // namespace memcli
