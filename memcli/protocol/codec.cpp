#include "codec.h"
#include "connection.h"

#include "../shared/hashing.h"
#include "../shared/parse_number.h"

namespace memcli::codec {

// ─── Commands ───

std::string_view verb_name(verb v)
{
    switch (v)
    {
        case verb_get:       return "get";
        case verb_gets:      return "gets";
        case verb_set:       return "set";
        case verb_add:       return "add";
        case verb_replace:   return "replace";
        case verb_append:    return "append";
        case verb_prepend:   return "prepend";
        case verb_cas:       return "cas";
        case verb_delete:    return "delete";
        case verb_incr:      return "incr";
        case verb_decr:      return "decr";
        case verb_touch:     return "touch";
        case verb_version:   return "version";
        case verb_flush_all: return "flush_all";
        case verb_stats:     return "stats";
        case verb_raw:       return "raw";
    }
    return "?";
}

bool is_storage(verb v)
{
    switch (v)
    {
        case verb_set:
        case verb_add:
        case verb_replace:
        case verb_append:
        case verb_prepend:
        case verb_cas:
            return true;
        default:
            return false;
    }
}

std::string encode(const command& cmd)
{
    std::string out;

    if (is_storage(cmd.kind))
    {
        out.reserve(cmd.key.size() + cmd.data.size() + 64);
        out += verb_name(cmd.kind);
        out += ' ';
        out += cmd.key;
        out += ' ';
        out += std::to_string(cmd.flags);
        out += ' ';
        out += std::to_string(cmd.exptime);
        out += ' ';
        out += std::to_string(cmd.data.size());
        if (cmd.kind == verb_cas)
        {
            out += ' ';
            out += std::to_string(cmd.number);
        }
        out += "\r\n";
        out += cmd.data;
        out += "\r\n";
        return out;
    }

    switch (cmd.kind)
    {
        case verb_get:
        case verb_gets:
        case verb_delete:
            out += verb_name(cmd.kind);
            out += ' ';
            out += cmd.key;
            break;

        case verb_incr:
        case verb_decr:
            out += verb_name(cmd.kind);
            out += ' ';
            out += cmd.key;
            out += ' ';
            out += std::to_string(cmd.number);
            break;

        case verb_touch:
            out += "touch ";
            out += cmd.key;
            out += ' ';
            out += std::to_string(cmd.exptime);
            break;

        case verb_version:
            out += "version";
            break;

        case verb_flush_all:
            out += "flush_all";
            if (cmd.number)
            {
                out += ' ';
                out += std::to_string(cmd.number);
            }
            break;

        case verb_stats:
            out += "stats";
            if (!cmd.text.empty())
            {
                out += ' ';
                out += cmd.text;
            }
            break;

        default:
            out += cmd.text;
            break;
    }

    out += "\r\n";
    return out;
}

command make_retrieval(verb v, std::string key)
{
    command cmd;
    cmd.kind = v;
    cmd.key = std::move(key);
    return cmd;
}

command make_storage(verb v, const item& it)
{
    command cmd;
    cmd.kind = v;
    cmd.key = it.key();
    cmd.data = it.value();
    cmd.flags = it.flags();
    cmd.exptime = it.expire();
    if (it.cas())
        cmd.number = *it.cas();
    return cmd;
}

command make_delete(std::string key)
{
    command cmd;
    cmd.kind = verb_delete;
    cmd.key = std::move(key);
    return cmd;
}

command make_counter(verb v, std::string key, uint64_t delta)
{
    command cmd;
    cmd.kind = v;
    cmd.key = std::move(key);
    cmd.number = delta;
    return cmd;
}

command make_touch(std::string key, uint32_t exptime)
{
    command cmd;
    cmd.kind = verb_touch;
    cmd.key = std::move(key);
    cmd.exptime = exptime;
    return cmd;
}

bool validate_key(std::string_view key, mc_error& err)
{
    if (key.empty())
    {
        err.set(err_invalid_key, "key is empty");
        return false;
    }
    if (key.size() > MAX_KEY_LENGTH)
    {
        err.set(err_invalid_key, "key is " + std::to_string(key.size())
                                 + " bytes, limit is " + std::to_string(MAX_KEY_LENGTH));
        return false;
    }
    for (char c : key)
    {
        auto b = static_cast<unsigned char>(c);
        if (b <= 0x20 || b == 0x7f)
        {
            err.set(err_invalid_key, "key contains whitespace or control characters");
            return false;
        }
    }
    return true;
}

// ─── Status lines ───

std::string_view status_name(reply_status s)
{
    switch (s)
    {
        case status_ok:           return "OK";
        case status_stored:       return "STORED";
        case status_not_stored:   return "NOT_STORED";
        case status_exists:       return "EXISTS";
        case status_deleted:      return "DELETED";
        case status_not_found:    return "NOT_FOUND";
        case status_touched:      return "TOUCHED";
        case status_error:        return "ERROR";
        case status_client_error: return "CLIENT_ERROR";
        case status_server_error: return "SERVER_ERROR";
        case status_unknown:      return "UNKNOWN";
    }
    return "?";
}

status_reply decode_status(std::string_view line)
{
    status_reply reply;

    size_t sp = line.find(' ');
    std::string_view head = line.substr(0, sp);
    std::string_view rest = sp == std::string_view::npos ? std::string_view{} : line.substr(sp + 1);

    switch (fnv1a(head))
    {
        case fnv1a("CLIENT_ERROR"):
            reply.status = status_client_error;
            reply.message = rest;
            return reply;
        case fnv1a("SERVER_ERROR"):
            reply.status = status_server_error;
            reply.message = rest;
            return reply;
        default:
            break;
    }

    // bare tokens only; anything trailing makes the line unknown
    if (sp == std::string_view::npos)
    {
        switch (fnv1a(head))
        {
            case fnv1a("OK"):         reply.status = status_ok;         return reply;
            case fnv1a("STORED"):     reply.status = status_stored;     return reply;
            case fnv1a("NOT_STORED"): reply.status = status_not_stored; return reply;
            case fnv1a("EXISTS"):     reply.status = status_exists;     return reply;
            case fnv1a("DELETED"):    reply.status = status_deleted;    return reply;
            case fnv1a("NOT_FOUND"):  reply.status = status_not_found;  return reply;
            case fnv1a("TOUCHED"):    reply.status = status_touched;    return reply;
            case fnv1a("ERROR"):      reply.status = status_error;      return reply;
            default: break;
        }
    }

    reply.status = status_unknown;
    reply.message = line;
    return reply;
}

bool status_to_error(const status_reply& reply, mc_error& err)
{
    switch (reply.status)
    {
        case status_error:
            err.set(err_client, "server does not know the command (ERROR)");
            return true;
        case status_client_error:
            err.set(err_client, reply.message);
            return true;
        case status_server_error:
            err.set(err_server, reply.message);
            return true;
        default:
            return false;
    }
}

// ─── Value blocks ───

bool parse_value_header(std::string_view line, value_header& out)
{
    std::string_view tok[6];
    size_t n = 0;
    size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && line[i] == ' ')
            ++i;
        if (i >= line.size())
            break;
        if (n == 6)
            return false;
        size_t start = i;
        while (i < line.size() && line[i] != ' ')
            ++i;
        tok[n++] = line.substr(start, i - start);
    }

    if ((n != 4 && n != 5) || tok[0] != "VALUE")
        return false;

    value_header h;
    h.key = tok[1];
    if (!parse_uint32(tok[2], h.flags))
        return false;
    uint64_t bytes;
    if (!parse_uint64(tok[3], bytes) || bytes > MAX_VALUE_BYTES)
        return false;
    h.bytes = static_cast<size_t>(bytes);
    if (n == 5)
    {
        uint64_t cas;
        if (!parse_uint64(tok[4], cas))
            return false;
        h.cas = cas;
    }

    out = std::move(h);
    return true;
}

static bool framing(connection& conn, std::string msg, mc_error& err)
{
    conn.close();
    err.set(err_framing, std::move(msg));
    return false;
}

block_result decode_value_block(connection& conn, std::string_view expected_key,
                                value_header& header, std::string& data, mc_error& err)
{
    std::string line;
    if (!conn.read_line(line, err))
        return block_failed;

    if (line == "END")
        return block_not_found;

    status_reply st = decode_status(line);
    if (status_to_error(st, err))
        return block_failed;

    if (!parse_value_header(line, header))
    {
        framing(conn, "malformed VALUE line: " + line, err);
        return block_failed;
    }
    if (header.key != expected_key)
    {
        framing(conn, "VALUE for unexpected key '" + header.key + "'", err);
        return block_failed;
    }

    // payload plus its CRLF in one read
    if (!conn.read_exact(header.bytes + 2, data, err))
        return block_failed;
    if (data[header.bytes] != '\r' || data[header.bytes + 1] != '\n')
    {
        framing(conn, "value for '" + header.key + "' is not " + std::to_string(header.bytes)
                      + " bytes as declared", err);
        return block_failed;
    }
    data.resize(header.bytes);

    if (!conn.read_line(line, err))
        return block_failed;
    if (line != "END")
    {
        framing(conn, "expected END after value, got: " + line, err);
        return block_failed;
    }
    return block_found;
}

// ─── Multi-line replies ───

bool read_block(connection& conn, std::vector<std::string>& lines,
                std::string& terminator, mc_error& err)
{
    lines.clear();
    terminator.clear();

    std::string line;
    for (;;)
    {
        if (!conn.read_line(line, err))
            return false;

        if (line == "END")
        {
            terminator = std::move(line);
            return true;
        }

        if (lines.empty() && (line == "OK" || line == "RESET"))
        {
            terminator = std::move(line);
            return true;
        }

        status_reply st = decode_status(line);
        if (status_to_error(st, err))
        {
            terminator = std::move(line);
            return false;
        }

        lines.push_back(std::move(line));
    }
}

// ─── Single-line payloads ───

bool decode_counter(std::string_view line, uint64_t& value)
{
    while (!line.empty() && line.back() == ' ')
        line.remove_suffix(1);
    return parse_uint64(line, value);
}

bool decode_version(std::string_view line, std::string& version)
{
    constexpr std::string_view prefix = "VERSION ";
    if (line.substr(0, prefix.size()) != prefix)
        return false;
    version = line.substr(prefix.size());
    return true;
}

} // namespace memcli::codec
