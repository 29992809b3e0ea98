#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../memcli/cli/client_config.h"
#include "../../memcli/shared/paths.h"

#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace memcli;

struct temp_config
{
    std::string path;

    explicit temp_config(const std::string& body)
    {
        static int seq = 0;
        path = "/tmp/memcli-config-" + std::to_string(getpid()) + "-" + std::to_string(seq++) + ".lua";
        std::ofstream(path) << body;
    }

    ~temp_config() { ::unlink(path.c_str()); }
};

TEST_CASE("full config table")
{
    temp_config cfg(R"(
config = {
    addr = "cache01:11212",
    timeout = 2.5,
    log_level = "info",
    max_value_size = "2M",
    tls = { ca = "/etc/ssl/mc-ca.pem", verify = false, server_name = "cache.internal" },
}
)");

    client_settings s;
    std::string error;
    REQUIRE(load_client_config(cfg.path, true, s, error));
    CHECK(s.addr == "cache01:11212");
    CHECK(s.timeout_ms == 2500);
    CHECK(s.level == log_info);
    CHECK(s.max_value_size == 2 * 1024 * 1024);
    CHECK(s.tls.enabled);
    CHECK_FALSE(s.tls.verify);
    CHECK(s.tls.ca_path == "/etc/ssl/mc-ca.pem");
    CHECK(s.tls.server_name == "cache.internal");
}

TEST_CASE("keys left out keep their defaults")
{
    temp_config cfg("config = { debug = true }\n");

    client_settings s;
    std::string error;
    REQUIRE(load_client_config(cfg.path, true, s, error));
    CHECK(s.addr.empty());
    CHECK(s.timeout_ms == 1000);
    CHECK(s.level == log_debug);
    CHECK(s.max_value_size == DEFAULT_MAX_VALUE_SIZE);
    CHECK_FALSE(s.tls.enabled);
}

TEST_CASE("a file without a config table changes nothing")
{
    temp_config cfg("local unrelated = 1\n");

    client_settings s;
    std::string error;
    CHECK(load_client_config(cfg.path, true, s, error));
    CHECK(s.timeout_ms == 1000);
}

TEST_CASE("bad config files")
{
    client_settings s;
    std::string error;

    SUBCASE("missing but optional")
    {
        CHECK(load_client_config("/nonexistent/memcli.lua", false, s, error));
        CHECK(error.empty());
    }

    SUBCASE("missing and required")
    {
        CHECK_FALSE(load_client_config("/nonexistent/memcli.lua", true, s, error));
        CHECK(error.find("cannot read") != std::string::npos);
    }

    SUBCASE("Lua syntax error")
    {
        temp_config cfg("config = {\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
        CHECK(error.find("error loading") == 0);
    }

    SUBCASE("unknown log level")
    {
        temp_config cfg("config = { log_level = \"chatty\" }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
        CHECK(error.find("chatty") != std::string::npos);
    }

    SUBCASE("negative timeout")
    {
        temp_config cfg("config = { timeout = -1 }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
    }

    SUBCASE("infinite timeout")
    {
        temp_config cfg("config = { timeout = 1/0 }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
        CHECK(error.find("timeout") != std::string::npos);
    }

    SUBCASE("NaN timeout")
    {
        temp_config cfg("config = { timeout = 0/0 }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
    }

    SUBCASE("timeout past the upper bound")
    {
        temp_config cfg("config = { timeout = 2e9 }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
        CHECK(s.timeout_ms == 1000);
    }

    SUBCASE("bad max_value_size")
    {
        temp_config cfg("config = { max_value_size = \"lots\" }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
    }

    SUBCASE("certificate without key")
    {
        temp_config cfg("config = { tls = { cert = \"c.pem\" } }\n");
        CHECK_FALSE(load_client_config(cfg.path, true, s, error));
        CHECK(error.find("tls.cert and tls.key") != std::string::npos);
    }
}

TEST_CASE("config file location")
{
    SUBCASE("MEMCLI_CONFIG wins and must exist")
    {
        setenv("MEMCLI_CONFIG", "/etc/memcli/custom.lua", 1);
        auto p = memcli_paths::resolve();
        CHECK(p.config_path == "/etc/memcli/custom.lua");
        CHECK(p.from_env);
        unsetenv("MEMCLI_CONFIG");
    }

    SUBCASE("XDG_CONFIG_HOME")
    {
        unsetenv("MEMCLI_CONFIG");
        setenv("XDG_CONFIG_HOME", "/home/u/.xdg", 1);
        auto p = memcli_paths::resolve();
        CHECK(p.config_path == "/home/u/.xdg/memcli/config.lua");
        CHECK_FALSE(p.from_env);
        unsetenv("XDG_CONFIG_HOME");
    }

    SUBCASE("home directory")
    {
        unsetenv("MEMCLI_CONFIG");
        unsetenv("XDG_CONFIG_HOME");
        setenv("HOME", "/home/u", 1);
        auto p = memcli_paths::resolve();
        CHECK(p.config_path == "/home/u/.config/memcli/config.lua");
    }
}
