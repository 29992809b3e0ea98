#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "arg_parser.h"
#include "client_config.h"

namespace memcli {

// Options given on the command line. Unset options leave the config file
// (or the defaults) in charge.
struct cli_flags
{
    std::optional<std::string> addr;
    std::optional<uint64_t> timeout_ms;
    std::optional<std::string> config_path;
    bool debug = false;
    bool show_help = false;
    bool show_version = false;

    bool tls = false;
    bool tls_no_verify = false;
    std::optional<std::string> tls_ca;
    std::optional<std::string> tls_cert;
    std::optional<std::string> tls_key;

    size_t command_index = 0;   // first word of the command in pa, == pa.count if none
};

// [ADDR] [options] [COMMAND [ARGS...]]; option parsing stops at the first
// word that is not an option. Returns 0 on success, 1 on a usage error
// (already reported on `err`).
int parse_cli_flags(const parsed_args& pa, cli_flags& flags, std::ostream& err);

// Flags win over whatever the config file set
void apply_cli_flags(const cli_flags& flags, client_settings& settings);

} // namespace memcli
