#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace memcli {

// "STAT <field> <value>" lines -> field/value, sorted by field
std::map<std::string, std::string> parse_stat_lines(const std::vector<std::string>& lines);

// # <title> - <addr>
// #                  Field             Value
//             curr_items                 3
std::string render_stats_table(std::string_view title, std::string_view addr,
                               const std::vector<std::string>& lines);

// Per slab class counters merged from "stats items" and "stats slabs"
struct slab_class
{
    uint64_t chunk_size{0};
    uint64_t total_pages{0};
    uint64_t free_chunks_end{0};
    uint64_t number{0};
    uint64_t age{0};
    uint64_t evicted{0};
    uint64_t evicted_time{0};
    uint64_t outofmemory{0};
};

std::map<uint32_t, slab_class> collect_slabs(const std::vector<std::string>& items_lines,
                                             const std::vector<std::string>& slabs_lines);

// One row per slab class that has pages
std::string render_slab_table(const std::vector<std::string>& items_lines,
                              const std::vector<std::string>& slabs_lines);

} // namespace memcli
