#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "codec.h"
#include "connection.h"
#include "endpoint.h"
#include "item.h"
#include "mc_error.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

namespace memcli {

// memcached's default item size limit (-I)
constexpr size_t DEFAULT_MAX_VALUE_SIZE = 1024 * 1024;
constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{1000};

struct data_source_options
{
    endpoint address;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
    tls_options tls;
    size_t max_value_size{DEFAULT_MAX_VALUE_SIZE};
};

// ─── Results ───

struct lines_result
{
    mc_error error;
    std::vector<std::string> lines;
    std::string terminator;

    explicit operator bool() const { return !error; }
};

struct get_result
{
    mc_error error;
    bool found{false};
    item value;

    explicit operator bool() const { return !error; }
};

// Storage verbs, delete, touch and flush_all. NOT_STORED, EXISTS and
// NOT_FOUND are outcomes, not errors.
struct status_result
{
    mc_error error;
    codec::reply_status status{codec::status_unknown};

    explicit operator bool() const { return !error; }
};

struct counter_result
{
    mc_error error;
    bool found{false};
    uint64_t value{0};

    explicit operator bool() const { return !error; }
};

struct version_result
{
    mc_error error;
    std::string version;

    explicit operator bool() const { return !error; }
};

// Session API over one connection. Connects lazily, validates arguments
// before anything is written, and reconnects at most once per operation:
// idempotent commands are retried after the reconnect, mutating ones only
// when the request never left in full.
class data_source
{
public:
    data_source(data_source_options opts, const logger& log);

    data_source(const data_source&) = delete;
    data_source& operator=(const data_source&) = delete;

    // Eager connect; operations connect on demand anyway
    bool open(mc_error& err);
    void close();
    bool is_connected() const { return m_conn.is_open(); }

    const endpoint& address() const { return m_opts.address; }
    const data_source_options& options() const { return m_opts; }

    // Raw informational command (stats family); reply lines verbatim
    lines_result query(std::string_view raw_command);

    get_result get(std::string_view key);
    get_result gets(std::string_view key);

    status_result set(std::string key, std::string value, uint32_t flags = 0, uint32_t expire = 0);
    status_result add(std::string key, std::string value, uint32_t flags = 0, uint32_t expire = 0);
    status_result replace(std::string key, std::string value, uint32_t flags = 0, uint32_t expire = 0);
    status_result append(std::string key, std::string value);
    status_result prepend(std::string key, std::string value);
    // The item must carry the cas token from gets
    status_result cas(const item& it);
    status_result store(codec::verb kind, const item& it);

    status_result remove(std::string_view key);
    status_result remove(const item& it) { return remove(it.key()); }

    counter_result incr(std::string_view key, uint64_t delta);
    counter_result decr(std::string_view key, uint64_t delta);
    status_result touch(std::string_view key, uint32_t expire);
    status_result flush_all(uint32_t delay = 0);
    version_result version();

private:
    using reply_reader = std::function<bool(mc_error&)>;

    bool ensure_connected(mc_error& err);
    bool reconnect(mc_error& err);
    bool attempt(const std::string& request, const reply_reader& read_reply, mc_error& err);
    bool execute(std::string_view name, const std::string& request, bool idempotent,
                 const reply_reader& read_reply, mc_error& err);

    bool read_status(std::string_view name, std::initializer_list<codec::reply_status> accepted,
                     codec::reply_status& status, mc_error& err);
    bool unexpected(std::string_view name, const std::string& line, mc_error& err);

    get_result retrieve(codec::verb kind, std::string_view key);
    counter_result counter(codec::verb kind, std::string_view key, uint64_t delta);

    data_source_options m_opts;
    const logger& m_log;
    connection m_conn;
    bool m_request_written{false};
};

} // namespace memcli
