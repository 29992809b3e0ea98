#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../memcli/protocol/codec.h"

using namespace memcli;
using namespace memcli::codec;

TEST_CASE("command encoding")
{
    SUBCASE("retrieval and delete")
    {
        CHECK(encode(make_retrieval(verb_get, "mykey1")) == "get mykey1\r\n");
        CHECK(encode(make_retrieval(verb_gets, "k")) == "gets k\r\n");
        CHECK(encode(make_delete("k")) == "delete k\r\n");
    }

    SUBCASE("storage commands carry the data block")
    {
        item it = item::build_for_set("mykey1", "MyValue1");
        CHECK(encode(make_storage(verb_set, it)) == "set mykey1 0 0 8\r\nMyValue1\r\n");

        item timed = item::build_for_set("k", "abc", 120, 1);
        CHECK(encode(make_storage(verb_add, timed)) == "add k 1 120 3\r\nabc\r\n");
        CHECK(encode(make_storage(verb_replace, timed)) == "replace k 1 120 3\r\nabc\r\n");
        CHECK(encode(make_storage(verb_append, timed)) == "append k 1 120 3\r\nabc\r\n");
        CHECK(encode(make_storage(verb_prepend, timed)) == "prepend k 1 120 3\r\nabc\r\n");
    }

    SUBCASE("cas appends the unique token")
    {
        item it = item::build_for_set("k", "v");
        it.set_cas(987654321);
        CHECK(encode(make_storage(verb_cas, it)) == "cas k 0 0 1 987654321\r\nv\r\n");
    }

    SUBCASE("binary data is sent untouched")
    {
        std::string data("a\r\nb\0c", 6);
        item it = item::build_for_set("bin", data);
        std::string wire = encode(make_storage(verb_set, it));
        CHECK(wire == std::string("set bin 0 0 6\r\na\r\nb\0c\r\n", 23));
    }

    SUBCASE("counters, touch, flush_all, version, stats")
    {
        CHECK(encode(make_counter(verb_incr, "n", 1)) == "incr n 1\r\n");
        CHECK(encode(make_counter(verb_decr, "n", 18446744073709551615ull))
              == "decr n 18446744073709551615\r\n");
        CHECK(encode(make_touch("k", 300)) == "touch k 300\r\n");

        command flush;
        flush.kind = verb_flush_all;
        CHECK(encode(flush) == "flush_all\r\n");
        flush.number = 10;
        CHECK(encode(flush) == "flush_all 10\r\n");

        command version;
        version.kind = verb_version;
        CHECK(encode(version) == "version\r\n");

        command stats;
        stats.kind = verb_stats;
        CHECK(encode(stats) == "stats\r\n");
        stats.text = "slabs";
        CHECK(encode(stats) == "stats slabs\r\n");
    }

    SUBCASE("raw text")
    {
        command raw;
        raw.text = "stats cachedump 1 20";
        CHECK(encode(raw) == "stats cachedump 1 20\r\n");
    }

    SUBCASE("verb names")
    {
        CHECK(verb_name(verb_flush_all) == "flush_all");
        CHECK(is_storage(verb_cas));
        CHECK_FALSE(is_storage(verb_delete));
        CHECK_FALSE(is_storage(verb_get));
    }
}

TEST_CASE("key validation")
{
    mc_error err;

    CHECK(validate_key("mykey1", err));
    CHECK_FALSE(err);
    CHECK(validate_key(std::string(MAX_KEY_LENGTH, 'k'), err));
    CHECK(validate_key("\xc3\xa9t\xc3\xa9", err));

    SUBCASE("empty")
    {
        CHECK_FALSE(validate_key("", err));
        CHECK(err.kind == err_invalid_key);
    }

    SUBCASE("too long")
    {
        CHECK_FALSE(validate_key(std::string(MAX_KEY_LENGTH + 1, 'k'), err));
        CHECK(err.kind == err_invalid_key);
    }

    SUBCASE("whitespace and control bytes")
    {
        CHECK_FALSE(validate_key("my key", err));
        CHECK(err.kind == err_invalid_key);
        CHECK_FALSE(validate_key("tab\tkey", err));
        CHECK_FALSE(validate_key("line\r\n", err));
        CHECK_FALSE(validate_key(std::string("nul\0", 4), err));
        CHECK_FALSE(validate_key("del\x7f", err));
    }
}

TEST_CASE("status decoding")
{
    SUBCASE("every bare token")
    {
        CHECK(decode_status("OK").status == status_ok);
        CHECK(decode_status("STORED").status == status_stored);
        CHECK(decode_status("NOT_STORED").status == status_not_stored);
        CHECK(decode_status("EXISTS").status == status_exists);
        CHECK(decode_status("DELETED").status == status_deleted);
        CHECK(decode_status("NOT_FOUND").status == status_not_found);
        CHECK(decode_status("TOUCHED").status == status_touched);
        CHECK(decode_status("ERROR").status == status_error);
    }

    SUBCASE("error messages are kept verbatim")
    {
        auto c = decode_status("CLIENT_ERROR bad data chunk");
        CHECK(c.status == status_client_error);
        CHECK(c.message == "bad data chunk");

        auto s = decode_status("SERVER_ERROR out of memory storing object");
        CHECK(s.status == status_server_error);
        CHECK(s.message == "out of memory storing object");
    }

    SUBCASE("unknown lines are surfaced, not dropped")
    {
        auto u = decode_status("BOGUS reply");
        CHECK(u.status == status_unknown);
        CHECK(u.message == "BOGUS reply");

        CHECK(decode_status("STORED extra").status == status_unknown);
        CHECK(decode_status("stored").status == status_unknown);
        CHECK(decode_status("").status == status_unknown);
    }

    SUBCASE("error statuses map to error kinds")
    {
        mc_error err;
        CHECK(status_to_error(decode_status("ERROR"), err));
        CHECK(err.kind == err_client);
        CHECK(status_to_error(decode_status("CLIENT_ERROR line too long"), err));
        CHECK(err.kind == err_client);
        CHECK(err.message == "line too long");
        CHECK(status_to_error(decode_status("SERVER_ERROR out of memory"), err));
        CHECK(err.kind == err_server);
        CHECK(err.message == "out of memory");

        err.clear();
        CHECK_FALSE(status_to_error(decode_status("NOT_FOUND"), err));
        CHECK_FALSE(err);
    }

    CHECK(status_name(status_not_stored) == "NOT_STORED");
}

TEST_CASE("VALUE header parsing")
{
    value_header h;

    SUBCASE("get form")
    {
        REQUIRE(parse_value_header("VALUE mykey1 0 8", h));
        CHECK(h.key == "mykey1");
        CHECK(h.flags == 0);
        CHECK(h.bytes == 8);
        CHECK_FALSE(h.cas.has_value());
    }

    SUBCASE("gets form")
    {
        REQUIRE(parse_value_header("VALUE k 4294967295 3 12345678901", h));
        CHECK(h.flags == 4294967295u);
        CHECK(h.bytes == 3);
        REQUIRE(h.cas.has_value());
        CHECK(*h.cas == 12345678901ull);
    }

    SUBCASE("malformed")
    {
        CHECK_FALSE(parse_value_header("VALUE k 0", h));
        CHECK_FALSE(parse_value_header("VALUE k x 3", h));
        CHECK_FALSE(parse_value_header("VALUE k 0 -3", h));
        CHECK_FALSE(parse_value_header("VALUE k 0 3 1 2", h));
        CHECK_FALSE(parse_value_header("VALUES k 0 3", h));
        CHECK_FALSE(parse_value_header("VALUE k 4294967296 3", h));
        CHECK_FALSE(parse_value_header("", h));
    }
}

TEST_CASE("single-line payloads")
{
    uint64_t n = 0;
    CHECK(decode_counter("42", n));
    CHECK(n == 42);
    CHECK(decode_counter("7   ", n));
    CHECK(n == 7);
    CHECK(decode_counter("18446744073709551615", n));
    CHECK(n == 18446744073709551615ull);
    CHECK_FALSE(decode_counter("NOT_FOUND", n));
    CHECK_FALSE(decode_counter("", n));
    CHECK_FALSE(decode_counter("12a", n));

    std::string v;
    CHECK(decode_version("VERSION 1.6.21", v));
    CHECK(v == "1.6.21");
    CHECK_FALSE(decode_version("VERSIONS 1", v));
    CHECK_FALSE(decode_version("ERROR", v));
}
