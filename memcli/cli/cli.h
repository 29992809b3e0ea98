#pragma once
#include <cstddef>
#include <istream>
#include <ostream>
#include <string_view>

#ifndef MEMCLI_VERSION
#define MEMCLI_VERSION "1.0.0"
#endif

namespace memcli {

class dispatcher;
struct parsed_args;

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_UNREACHABLE = 2;

int cli_main(int argc, char** argv);

// One command from argv; pa.args[first] is the command word
int cli_batch(dispatcher& d, const parsed_args& pa, size_t first, std::ostream& out);

// Reads commands line by line until EOF, quit or SIGINT/SIGQUIT. With
// `interactive` a prompt is printed before every line.
int cli_lines(dispatcher& d, std::istream& in, std::ostream& out,
              std::string_view prompt, bool interactive);

void print_usage(std::ostream& out);

} // namespace memcli
