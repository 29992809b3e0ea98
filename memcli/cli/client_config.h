#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "../protocol/data_source.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

namespace memcli {

// Effective client settings: defaults, then the Lua config file, then flags.
struct client_settings
{
    std::string addr;                   // unparsed; empty means the default endpoint
    uint64_t timeout_ms{static_cast<uint64_t>(DEFAULT_TIMEOUT.count())};
    log_level level{log_warn};
    size_t max_value_size{DEFAULT_MAX_VALUE_SIZE};
    tls_options tls;
};

// Reads `config = { ... }` from a Lua file and overrides the keys it sets:
//
//   config = {
//       addr = "127.0.0.1:11211",
//       timeout = 1.5,               -- seconds
//       debug = false,               -- or log_level = "info"
//       max_value_size = "2M",
//       tls = { enabled = true, ca = "...", cert = "...", key = "...",
//               verify = true, server_name = "..." },
//   }
//
// A missing file is not an error when `required` is false.
bool load_client_config(const std::string& path, bool required,
                        client_settings& settings, std::string& error);

} // namespace memcli
