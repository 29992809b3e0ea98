#include "stats_view.h"

#include <cctype>
#include <cinttypes>
#include <cstdio>

#include "../shared/hashing.h"
#include "../shared/parse_number.h"

namespace memcli {

static bool is_stat_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::map<std::string, std::string> parse_stat_lines(const std::vector<std::string>& lines)
{
    std::map<std::string, std::string> out;
    for (const auto& line : lines)
    {
        std::string_view sv = line;
        if (sv.substr(0, 4) != "STAT")
            continue;
        sv.remove_prefix(4);

        size_t i = 0;
        while (i < sv.size() && is_stat_space(sv[i]))
            ++i;
        if (i == 0)
            continue;

        size_t start = i;
        while (i < sv.size() && !is_stat_space(sv[i]))
            ++i;
        std::string_view field = sv.substr(start, i - start);

        size_t gap = i;
        while (i < sv.size() && is_stat_space(sv[i]))
            ++i;
        if (i == gap)
            continue;

        out[std::string(field)] = std::string(sv.substr(i));
    }
    return out;
}

// printf's %<width>s without a length limit
static void append_right(std::string& out, std::string_view text, size_t width)
{
    if (text.size() < width)
        out.append(width - text.size(), ' ');
    out += text;
}

std::string render_stats_table(std::string_view title, std::string_view addr,
                               const std::vector<std::string>& lines)
{
    std::string out;
    out += "# ";
    out += title;
    out += " - ";
    out += addr;
    out += "\n#";
    append_right(out, "Field", 23);
    out += "  ";
    append_right(out, "Value", 16);
    out += '\n';

    for (const auto& [field, value] : parse_stat_lines(lines))
    {
        append_right(out, field, 24);
        out += "  ";
        append_right(out, value, 16);
        out += '\n';
    }
    return out;
}

// "<class>:<field> <number>" with anything after the number ignored
static bool parse_slab_stat(std::string_view sv, uint32_t& cls, std::string_view& field, uint64_t& value)
{
    size_t i = 0;
    while (i < sv.size() && sv[i] >= '0' && sv[i] <= '9')
        ++i;
    if (i == 0 || i >= sv.size() || sv[i] != ':')
        return false;
    if (!parse_uint32(sv.substr(0, i), cls))
        return false;

    size_t start = ++i;
    while (i < sv.size() && (std::isalnum(static_cast<unsigned char>(sv[i])) || sv[i] == '_'))
        ++i;
    if (i == start || i >= sv.size() || sv[i] != ' ')
        return false;
    field = sv.substr(start, i - start);

    start = ++i;
    while (i < sv.size() && sv[i] >= '0' && sv[i] <= '9')
        ++i;
    return i > start && parse_uint64(sv.substr(start, i - start), value);
}

static void apply_slab_field(slab_class& slab, std::string_view field, uint64_t value)
{
    switch (fnv1a(field))
    {
        case fnv1a("chunk_size"):      slab.chunk_size = value; break;
        case fnv1a("total_pages"):     slab.total_pages = value; break;
        case fnv1a("free_chunks_end"): slab.free_chunks_end = value; break;
        case fnv1a("number"):          slab.number = value; break;
        case fnv1a("age"):             slab.age = value; break;
        case fnv1a("evicted"):         slab.evicted = value; break;
        case fnv1a("evicted_time"):    slab.evicted_time = value; break;
        case fnv1a("outofmemory"):     slab.outofmemory = value; break;
        default: break;
    }
}

std::map<uint32_t, slab_class> collect_slabs(const std::vector<std::string>& items_lines,
                                             const std::vector<std::string>& slabs_lines)
{
    constexpr std::string_view items_prefix = "STAT items:";
    constexpr std::string_view slabs_prefix = "STAT ";

    std::map<uint32_t, slab_class> slabs;
    uint32_t cls;
    std::string_view field;
    uint64_t value;

    for (const auto& line : items_lines)
    {
        std::string_view sv = line;
        if (sv.substr(0, items_prefix.size()) != items_prefix)
            continue;
        if (parse_slab_stat(sv.substr(items_prefix.size()), cls, field, value))
            apply_slab_field(slabs[cls], field, value);
    }

    for (const auto& line : slabs_lines)
    {
        std::string_view sv = line;
        if (sv.substr(0, slabs_prefix.size()) != slabs_prefix)
            continue;
        if (parse_slab_stat(sv.substr(slabs_prefix.size()), cls, field, value))
            apply_slab_field(slabs[cls], field, value);
    }

    return slabs;
}

std::string render_slab_table(const std::vector<std::string>& items_lines,
                              const std::vector<std::string>& slabs_lines)
{
    std::string out = "  #  Item_Size  Max_age   Pages   Count   Full?  Evicted Evict_Time OOM\n";

    char size[32];
    char row[256];
    for (const auto& [cls, slab] : collect_slabs(items_lines, slabs_lines))
    {
        if (!slab.total_pages)
            continue;

        if (slab.chunk_size < 1024)
            std::snprintf(size, sizeof(size), "%" PRIu64 "B", slab.chunk_size);
        else
            std::snprintf(size, sizeof(size), "%.1fK", static_cast<double>(slab.chunk_size) / 1024.0);

        std::snprintf(row, sizeof(row),
                      "%3" PRIu32 " %8s %9" PRIu64 "s %7" PRIu64 " %7" PRIu64 " %7s %8" PRIu64 " %8" PRIu64 " %4" PRIu64 "\n",
                      cls, size, slab.age, slab.total_pages, slab.number,
                      slab.free_chunks_end == 0 ? "yes" : "no",
                      slab.evicted, slab.evicted_time, slab.outofmemory);
        out += row;
    }
    return out;
}

} // namespace memcli
