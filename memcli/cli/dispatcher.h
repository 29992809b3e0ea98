#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "arg_parser.h"
#include "commands.h"
#include "../protocol/data_source.h"

namespace memcli {

// Runs one front-end command against a data source and renders the result.
// Normal output goes to `out`; failures get one diagnostic on `err`.
class dispatcher
{
public:
    dispatcher(data_source& ds, std::ostream& out, std::ostream& err,
               std::string_view program = "memcli");

    // pa.args[first..] are the command's arguments. Returns false when the
    // command failed (bad usage or an error from the server/connection).
    bool run(command_id id, const parsed_args& pa, size_t first);

    // Kind of the last data source error, err_none after a success
    error_kind last_error() const { return m_last_error.kind; }
    bool last_error_was_connect() const;

    std::string_view program() const { return m_program; }

private:
    bool do_help(const parsed_args& pa, size_t first);
    bool do_version();
    bool do_display();
    bool do_stats(std::string_view title, std::string_view query);
    bool do_cachedump(const parsed_args& pa, size_t first);
    bool do_detaildump();
    bool do_detail(const parsed_args& pa, size_t first);
    bool do_get(const parsed_args& pa, size_t first, bool with_cas);
    bool do_store(codec::verb kind, const parsed_args& pa, size_t first);
    bool do_cas(const parsed_args& pa, size_t first);
    bool do_delete(const parsed_args& pa, size_t first);
    bool do_counter(codec::verb kind, const parsed_args& pa, size_t first);
    bool do_touch(const parsed_args& pa, size_t first);
    bool do_flush_all(const parsed_args& pa, size_t first);

    bool print_lines(const lines_result& res, std::string_view what);
    bool print_store_outcome(const status_result& res, std::string_view key,
                             std::string_view value);
    bool fail(std::string_view what, const mc_error& error);

    data_source& m_ds;
    std::ostream& m_out;
    std::ostream& m_err;
    std::string m_program;
    mc_error m_last_error;
};

} // namespace memcli
