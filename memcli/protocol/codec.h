#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "item.h"
#include "mc_error.h"

// memcached text protocol encoder/decoder

namespace memcli {

class connection;

namespace codec {

constexpr size_t MAX_KEY_LENGTH = 250;
// Upper bound accepted from a VALUE header, independent of the client's
// configured item size limit
constexpr size_t MAX_VALUE_BYTES = 1024u * 1024u * 1024u;

// ─── Commands ───

enum verb : uint8_t
{
    verb_get       = 0,
    verb_gets      = 1,
    verb_set       = 2,
    verb_add       = 3,
    verb_replace   = 4,
    verb_append    = 5,
    verb_prepend   = 6,
    verb_cas       = 7,
    verb_delete    = 8,
    verb_incr      = 9,
    verb_decr      = 10,
    verb_touch     = 11,
    verb_version   = 12,
    verb_flush_all = 13,
    verb_stats     = 14,
    verb_raw       = 15
};

struct command
{
    verb kind{verb_raw};
    std::string key;
    std::string data;       // storage payload
    uint32_t flags{0};
    uint32_t exptime{0};    // storage and touch
    uint64_t number{0};     // cas unique, incr/decr delta, flush_all delay
    std::string text;       // stats argument or the raw command line
};

std::string_view verb_name(verb v);
bool is_storage(verb v);

// Wire bytes for the command, CRLF terminated; storage commands include the
// data block.
std::string encode(const command& cmd);

// Convenience builders
command make_retrieval(verb v, std::string key);
command make_storage(verb v, const item& it);
command make_delete(std::string key);
command make_counter(verb v, std::string key, uint64_t delta);
command make_touch(std::string key, uint32_t exptime);

// Non-empty, at most MAX_KEY_LENGTH bytes, no whitespace or control bytes
bool validate_key(std::string_view key, mc_error& err);

// ─── Status lines ───

enum reply_status : uint8_t
{
    status_ok           = 0,
    status_stored       = 1,
    status_not_stored   = 2,
    status_exists       = 3,
    status_deleted      = 4,
    status_not_found    = 5,
    status_touched      = 6,
    status_error        = 7,    // ERROR: unknown command
    status_client_error = 8,
    status_server_error = 9,
    status_unknown      = 10
};

struct status_reply
{
    reply_status status{status_unknown};
    std::string message;    // CLIENT_ERROR/SERVER_ERROR text, or the raw line if unknown
};

std::string_view status_name(reply_status s);
status_reply decode_status(std::string_view line);

// Turns ERROR / CLIENT_ERROR / SERVER_ERROR into the matching error kind.
// Returns false for every other status.
bool status_to_error(const status_reply& reply, mc_error& err);

// ─── Value blocks ───

bool parse_value_header(std::string_view line, value_header& out);

enum block_result : uint8_t
{
    block_found     = 0,
    block_not_found = 1,
    block_failed    = 2
};

// Reads one get/gets reply: END, or VALUE header + exactly <bytes> bytes +
// CRLF + END. Framing violations close the connection.
block_result decode_value_block(connection& conn, std::string_view expected_key,
                                value_header& header, std::string& data, mc_error& err);

// ─── Multi-line replies ───

// Reads lines until END (or a lone OK/RESET acknowledgement, or an error
// line). Returned lines exclude the terminator.
bool read_block(connection& conn, std::vector<std::string>& lines,
                std::string& terminator, mc_error& err);

// ─── Single-line payloads ───

// incr/decr: digits -> value
bool decode_counter(std::string_view line, uint64_t& value);

// "VERSION <text>" -> text
bool decode_version(std::string_view line, std::string& version);

} // namespace codec
} // namespace memcli
