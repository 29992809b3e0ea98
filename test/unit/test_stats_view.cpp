#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../memcli/cli/stats_view.h"

using namespace memcli;

TEST_CASE("STAT line parsing")
{
    std::vector<std::string> lines = {
        "STAT pid 1234",
        "STAT version 1.6.21",
        "STAT rusage_user 0.123456",
        "STAT   spaced   value with spaces",
        "STATS not_a_stat 1",
        "garbage",
    };

    auto stats = parse_stat_lines(lines);
    CHECK(stats.size() == 4);
    CHECK(stats["pid"] == "1234");
    CHECK(stats["version"] == "1.6.21");
    CHECK(stats["spaced"] == "value with spaces");
    CHECK(stats.count("not_a_stat") == 0);
}

TEST_CASE("stats table")
{
    std::vector<std::string> lines = {
        "STAT uptime 42",
        "STAT curr_items 3",
    };

    std::string out = render_stats_table("stats", "127.0.0.1:11211", lines);
    CHECK(out ==
          "# stats - 127.0.0.1:11211\n"
          "#                  Field             Value\n"
          "              curr_items                 3\n"
          "                  uptime                42\n");
}

TEST_CASE("slab table")
{
    std::vector<std::string> items = {
        "STAT items:1:number 5",
        "STAT items:1:age 120",
        "STAT items:1:evicted 2",
        "STAT items:1:evicted_time 7",
        "STAT items:1:outofmemory 0",
        "STAT items:5:number 1",
    };
    std::vector<std::string> slabs = {
        "STAT 1:chunk_size 96",
        "STAT 1:total_pages 1",
        "STAT 1:free_chunks_end 0",
        "STAT 3:chunk_size 152",
        "STAT 3:total_pages 0",
        "STAT 5:chunk_size 2048",
        "STAT 5:total_pages 2",
        "STAT 5:free_chunks_end 10",
        "STAT active_slabs 2",
        "STAT total_malloced 2097152",
    };

    auto classes = collect_slabs(items, slabs);
    CHECK(classes[1].number == 5);
    CHECK(classes[1].chunk_size == 96);
    CHECK(classes[5].free_chunks_end == 10);

    std::string out = render_slab_table(items, slabs);
    CHECK(out ==
          "  #  Item_Size  Max_age   Pages   Count   Full?  Evicted Evict_Time OOM\n"
          "  1      96B       120s       1       5     yes        2        7    0\n"
          "  5     2.0K         0s       2       1      no        0        0    0\n");
}

TEST_CASE("slab table without populated classes")
{
    std::string out = render_slab_table({}, {"STAT active_slabs 0"});
    CHECK(out == "  #  Item_Size  Max_age   Pages   Count   Full?  Evicted Evict_Time OOM\n");
}
