#include "item.h"

#include <cstdio>

namespace memcli {

bool item::from_get_reply(const value_header& header, std::string data,
                          item& out, mc_error& err)
{
    if (data.size() != header.bytes)
    {
        err.set(err_framing, "value for '" + header.key + "' has " + std::to_string(data.size())
                             + " bytes, header declared " + std::to_string(header.bytes));
        return false;
    }

    out.m_key = header.key;
    out.m_value = std::move(data);
    out.m_flags = header.flags;
    out.m_expire = 0;
    out.m_cas = header.cas;
    return true;
}

item item::build_for_set(std::string key, std::string value, uint32_t expire, uint32_t flags)
{
    item it;
    it.m_key = std::move(key);
    it.m_value = std::move(value);
    it.m_expire = expire;
    it.m_flags = flags;
    return it;
}

bool item::is_display_safe() const
{
    if (m_value.empty())
        return true;

    auto c = static_cast<unsigned char>(m_value.front());
    if (c >= 0x21 && c <= 0x7e)
        return true;
    switch (c)
    {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
            return true;
        default:
            return false;
    }
}

std::string item::display_value() const
{
    if (!is_display_safe())
        return std::string(NOT_ASCII);

    if (m_value.size() <= DISPLAY_LENGTH)
        return m_value;

    std::string out;
    out.reserve(DISPLAY_LENGTH - 1 + TRUNCATION_MARKER.size());
    out.append(m_value, 0, DISPLAY_LENGTH - 1);
    out.append(TRUNCATION_MARKER);
    return out;
}

static void append_field(std::string& out, const char* name, const std::string& value)
{
    char head[32];
    std::snprintf(head, sizeof(head), "    %6s:    ", name);
    out += head;
    out += value;
    out += '\n';
}

std::string item::describe() const
{
    std::string out;
    append_field(out, "key", m_key);
    append_field(out, "value", display_value());
    append_field(out, "flags", std::to_string(m_flags));
    append_field(out, "length", std::to_string(length()));
    if (m_cas)
        append_field(out, "cas", std::to_string(*m_cas));
    return out;
}

} // namespace memcli
