#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../memcli/protocol/endpoint.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using namespace memcli;

TEST_CASE("endpoint parsing")
{
    endpoint ep;

    SUBCASE("empty means the default server")
    {
        REQUIRE(parse_endpoint("", ep));
        CHECK(ep.to_string() == "127.0.0.1:11211");
        CHECK_FALSE(ep.is_local());
    }

    SUBCASE("bare host takes the default port")
    {
        REQUIRE(parse_endpoint("localhost", ep));
        CHECK(ep.host == "localhost");
        CHECK(ep.port == 11211);
        CHECK(ep.to_string() == "localhost:11211");
    }

    SUBCASE("port only takes the default host")
    {
        REQUIRE(parse_endpoint(":11212", ep));
        CHECK(ep.to_string() == "127.0.0.1:11212");
    }

    SUBCASE("host and port")
    {
        REQUIRE(parse_endpoint("cache01.example.com:22122", ep));
        CHECK(ep.host == "cache01.example.com");
        CHECK(ep.port == 22122);
    }

    SUBCASE("IPv6")
    {
        REQUIRE(parse_endpoint("[::1]:11211", ep));
        CHECK(ep.host == "::1");
        CHECK(ep.port == 11211);
        CHECK(ep.to_string() == "[::1]:11211");

        REQUIRE(parse_endpoint("[fe80::1]", ep));
        CHECK(ep.port == 11211);

        REQUIRE(parse_endpoint("::1", ep));
        CHECK(ep.host == "::1");
        CHECK(ep.to_string() == "[::1]:11211");
    }

    SUBCASE("socket path")
    {
        REQUIRE(parse_endpoint("/tmp/mc.sock", ep));
        CHECK(ep.is_local());
        CHECK(ep.path == "/tmp/mc.sock");
        CHECK(ep.to_string() == "/tmp/mc.sock");
    }

    SUBCASE("rejects bad ports")
    {
        CHECK_FALSE(parse_endpoint("host:", ep));
        CHECK_FALSE(parse_endpoint("host:0", ep));
        CHECK_FALSE(parse_endpoint("host:65536", ep));
        CHECK_FALSE(parse_endpoint("host:abc", ep));
        CHECK_FALSE(parse_endpoint("[::1]x", ep));
        CHECK_FALSE(parse_endpoint("[::1", ep));
        CHECK_FALSE(parse_endpoint("[]", ep));
    }
}

TEST_CASE("leading word as address")
{
    CHECK(looks_like_endpoint("localhost"));
    CHECK(looks_like_endpoint("localhost:11211"));
    CHECK(looks_like_endpoint("127.0.0.1"));
    CHECK(looks_like_endpoint(":11212"));
    CHECK(looks_like_endpoint("[::1]:11211"));
    CHECK(looks_like_endpoint("cache01.example.com"));
    CHECK(looks_like_endpoint("cache01:11211"));

    CHECK_FALSE(looks_like_endpoint(""));
    CHECK_FALSE(looks_like_endpoint("stats"));
    CHECK_FALSE(looks_like_endpoint("get"));
    CHECK_FALSE(looks_like_endpoint("\\h"));
    CHECK_FALSE(looks_like_endpoint("-a"));
    CHECK_FALSE(looks_like_endpoint("flush_all"));
    CHECK_FALSE(looks_like_endpoint("/nonexistent/memcli.sock"));

    SUBCASE("existing unix socket")
    {
        std::string path = "/tmp/memcli-endpoint-" + std::to_string(getpid()) + ".sock";
        ::unlink(path.c_str());
        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);

        CHECK(looks_like_endpoint(path));

        ::close(fd);
        ::unlink(path.c_str());
    }
}
