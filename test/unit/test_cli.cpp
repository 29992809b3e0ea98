#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "fake_memcached.h"
#include "../../memcli/cli/cli.h"
#include "../../memcli/cli/dispatcher.h"
#include "../../memcli/cli/flag_handlers.h"

#include <sstream>

using namespace memcli;

static const logger quiet(log_error, nullptr);

static data_source_options options_for(const fake_memcached& srv)
{
    data_source_options opts;
    opts.address = srv.address();
    opts.timeout = std::chrono::milliseconds(2000);
    return opts;
}

// ─── Flags ───

static int parse_words(std::initializer_list<const char*> words, cli_flags& flags, std::ostream& err)
{
    static std::vector<std::string> storage;
    static std::vector<char*> argv;
    storage.assign(words.begin(), words.end());
    argv.clear();
    for (auto& s : storage)
        argv.push_back(s.data());

    static parsed_args pa;
    pa.assign(static_cast<int>(argv.size()), argv.data(), 0);
    return parse_cli_flags(pa, flags, err);
}

TEST_CASE("command-line flags")
{
    std::ostringstream err;
    cli_flags flags;

    SUBCASE("leading address and a command")
    {
        REQUIRE(parse_words({"localhost:11212", "-t", "2.5", "get", "k"}, flags, err) == 0);
        REQUIRE(flags.addr.has_value());
        CHECK(*flags.addr == "localhost:11212");
        REQUIRE(flags.timeout_ms.has_value());
        CHECK(*flags.timeout_ms == 2500);
        CHECK(flags.command_index == 3);
    }

    SUBCASE("option parsing stops at the command")
    {
        REQUIRE(parse_words({"-d", "incr", "n", "-5"}, flags, err) == 0);
        CHECK(flags.debug);
        CHECK(flags.command_index == 1);
    }

    SUBCASE("long options")
    {
        REQUIRE(parse_words({"--addr", "[::1]:11211", "--config", "/etc/memcli.lua",
                             "--tls-ca", "ca.pem", "--tls-no-verify"}, flags, err) == 0);
        CHECK(*flags.addr == "[::1]:11211");
        CHECK(*flags.config_path == "/etc/memcli.lua");
        CHECK(flags.tls);
        CHECK(flags.tls_no_verify);
        CHECK(*flags.tls_ca == "ca.pem");
        CHECK(flags.command_index == 7);
    }

    SUBCASE("usage errors")
    {
        CHECK(parse_words({"-a"}, flags, err) == 1);
        CHECK(parse_words({"--bogus"}, flags, err) == 1);
        CHECK(parse_words({"-t", "soon"}, flags, err) == 1);
        CHECK(parse_words({"-a", "host:99999"}, flags, err) == 1);
        CHECK(parse_words({"--tls-cert", "c.pem"}, flags, err) == 1);
        CHECK_FALSE(err.str().empty());
    }

    SUBCASE("flags override config values")
    {
        REQUIRE(parse_words({"-a", "cache01:11211", "-d", "--tls"}, flags, err) == 0);
        client_settings settings;
        settings.addr = "from-config:11211";
        settings.timeout_ms = 3000;
        apply_cli_flags(flags, settings);
        CHECK(settings.addr == "cache01:11211");
        CHECK(settings.timeout_ms == 3000);
        CHECK(settings.level == log_debug);
        CHECK(settings.tls.enabled);
        CHECK(settings.tls.verify);
    }
}

// ─── Commands without a server ───

TEST_CASE("help and unknown commands need no server")
{
    data_source_options opts;
    opts.address.path = "/tmp/memcli-test-unused.sock";
    data_source ds(opts, quiet);
    std::ostringstream out, err;
    dispatcher d(ds, out, err);
    parsed_args pa;

    SUBCASE("general help lists every command")
    {
        pa.parse("help");
        CHECK(d.run(cmd_help, pa, 1));
        std::string text = out.str();
        CHECK(text.find("[Available Commands]") != std::string::npos);
        CHECK(text.find("\\q, quit, exit              Exit\n") != std::string::npos);
        CHECK(text.find("\\cd, cachedump, dump        Show cachedump of specified slab\n") != std::string::npos);
        CHECK(text.find("Type \\h <command> for each.") != std::string::npos);
    }

    SUBCASE("help for one command")
    {
        pa.parse("\\h \\cd");
        CHECK(d.run(cmd_help, pa, 1));
        std::string text = out.str();
        CHECK(text.find("[Command \"\\cd\"]") != std::string::npos);
        CHECK(text.find("Aliases:\n    \\cd, cachedump, dump\n") != std::string::npos);
        CHECK(text.find("> cachedump 1 10") != std::string::npos);
    }

    SUBCASE("help for an unknown word falls back to the list")
    {
        pa.parse("help nope");
        CHECK(d.run(cmd_help, pa, 1));
        CHECK(out.str().find("Unknown command: nope\n") == 0);
    }

    SUBCASE("batch: unknown command")
    {
        pa.parse("frobnicate");
        CHECK(cli_batch(d, pa, 0, out) == EXIT_FAILED);
        CHECK(out.str() == "Unknown command - frobnicate\n");
    }

    SUBCASE("batch: quit")
    {
        pa.parse("quit");
        CHECK(cli_batch(d, pa, 0, out) == EXIT_OK);
        CHECK(out.str() == "Nothing to do with quit\n");
    }

    SUBCASE("usage mistakes are reported before connecting")
    {
        pa.parse("get");
        CHECK_FALSE(d.run(cmd_get, pa, 1));
        pa.parse("set onlykey");
        CHECK_FALSE(d.run(cmd_set, pa, 1));
        pa.parse("cachedump");
        CHECK_FALSE(d.run(cmd_cachedump, pa, 1));
        pa.parse("detail maybe");
        CHECK_FALSE(d.run(cmd_detail, pa, 1));
        pa.parse("set k v soon");
        CHECK_FALSE(d.run(cmd_set, pa, 1));
        CHECK(out.str() ==
              "No KEY specified.\n"
              "KEY or VALUE not specified.\n"
              "No slab class specified.\n"
              "Mode must be 'on' or 'off'!\n"
              "EXPIRE must be a number - soon\n");
        CHECK_FALSE(ds.is_connected());
    }

    SUBCASE("batch: unreachable server exits with 2")
    {
        pa.parse("get k");
        CHECK(cli_batch(d, pa, 0, out) == EXIT_UNREACHABLE);
        CHECK(d.last_error_was_connect());
    }
}

// ─── Sessions against a scripted server ───

TEST_CASE("set and get through the line loop")
{
    fake_memcached srv;
    srv.exchange("set mykey1 0 0 8\r\nMyValue1\r\n", "STORED\r\n")
       .exchange("get mykey1\r\n", "VALUE mykey1 0 8\r\nMyValue1\r\nEND\r\n")
       .exchange("get nothing\r\n", "END\r\n")
       .exchange("delete mykey1\r\n", "DELETED\r\n");
    srv.start();

    data_source ds(options_for(srv), quiet);
    std::ostringstream out, err;
    dispatcher d(ds, out, err);

    std::istringstream in("set mykey1 MyValue1\n"
                          "\n"
                          "get mykey1\r\n"
                          "get nothing\n"
                          "bogus words\n"
                          "delete mykey1\n"
                          "quit\n"
                          "get never-sent\n");
    int rc = cli_lines(d, in, out, "memcached@test> ", false);

    CHECK(rc == EXIT_FAILED);
    CHECK(out.str() ==
          "OK\n"
          "       key:    mykey1\n"
          "     value:    MyValue1\n"
          "     flags:    0\n"
          "    length:    8\n"
          "Not found - nothing\n"
          "Unknown command - bogus words\n"
          "OK\n");

    ds.close();
    CHECK(srv.finish());
}

TEST_CASE("stats, display and detail rendering")
{
    fake_memcached srv;
    srv.exchange("stats\r\n", "STAT uptime 42\r\nSTAT curr_items 3\r\nEND\r\n")
       .exchange("stats items\r\n", "STAT items:1:number 5\r\nSTAT items:1:age 120\r\nEND\r\n")
       .exchange("stats slabs\r\n", "STAT 1:chunk_size 96\r\nSTAT 1:total_pages 1\r\n"
                                    "STAT active_slabs 1\r\nEND\r\n")
       .exchange("stats detail on\r\n", "OK\r\n")
       .exchange("stats cachedump 1 20\r\n", "ITEM mykey1 [8 b; 0 s]\r\nEND\r\n")
       .exchange("version\r\n", "VERSION 1.6.21\r\n");
    srv.start();

    data_source ds(options_for(srv), quiet);
    std::ostringstream out, err;
    dispatcher d(ds, out, err);

    std::istringstream in("\\s\n\\d\ndetail on\n\\cd 1\n\\v\n");
    CHECK(cli_lines(d, in, out, "", false) == EXIT_OK);

    std::string addr = srv.path();
    CHECK(out.str() ==
          "# stats - " + addr + "\n"
          "#                  Field             Value\n"
          "              curr_items                 3\n"
          "                  uptime                42\n"
          "  #  Item_Size  Max_age   Pages   Count   Full?  Evicted Evict_Time OOM\n"
          "  1      96B       120s       1       5     yes        0        0    0\n"
          "Enabled stats collection for detail dump.\n"
          "ITEM mykey1 [8 b; 0 s]\n"
          "1.6.21\n");
    CHECK(err.str().empty());

    ds.close();
    CHECK(srv.finish());
}

TEST_CASE("server failures are reported once and the loop continues")
{
    fake_memcached srv;
    srv.exchange("set k 0 0 1\r\nv\r\n", "SERVER_ERROR out of memory storing object\r\n")
       .exchange("add k 0 0 1\r\nv\r\n", "NOT_STORED\r\n")
       .exchange("incr k 2\r\n", "7\r\n");
    srv.start();

    data_source ds(options_for(srv), quiet);
    std::ostringstream out, err;
    dispatcher d(ds, out, err);

    std::istringstream in("set k v\nadd k v\nincr k 2\n");
    CHECK(cli_lines(d, in, out, "", false) == EXIT_FAILED);

    CHECK(out.str() ==
          "Command seems failed. Type \\h set for help.\n\n"
          "Not stored - k\n"
          "Command seems failed. Type \\h add for help.\n\n"
          "7\n");
    CHECK(err.str() == "Failed to store item. KEY k, VALUE v (server error): out of memory storing object\n");
    CHECK(d.last_error() == err_none);

    ds.close();
    CHECK(srv.finish());
}
