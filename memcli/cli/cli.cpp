#include "cli.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h>

#include "arg_parser.h"
#include "client_config.h"
#include "commands.h"
#include "dispatcher.h"
#include "flag_handlers.h"
#include "../protocol/data_source.h"
#include "../protocol/endpoint.h"
#include "../shared/logging.h"
#include "../shared/paths.h"

namespace memcli {

static volatile sig_atomic_t g_interactive_quit = 0;

static void interactive_signal(int)
{
    g_interactive_quit = 1;
}

void print_usage(std::ostream& out)
{
    out << "usage: memcli [ADDR] [options] [COMMAND [ARGS...]]\n"
           "\n"
           "options:\n"
           "  -a, --addr ADDR       server address: host[:port], [v6]:port or a socket path\n"
           "                        (default 127.0.0.1:11211)\n"
           "  -t, --timeout SEC     connect/read/write timeout (default 1)\n"
           "  -d, --debug           debug logging on stderr\n"
           "  -c, --config FILE     Lua config file\n"
           "      --tls             connect with TLS\n"
           "      --tls-ca FILE     CA certificates for peer verification\n"
           "      --tls-cert FILE   client certificate\n"
           "      --tls-key FILE    client private key\n"
           "      --tls-no-verify   skip peer verification\n"
           "  -h, --help            this help\n"
           "  -V, --version         print version\n"
           "\n"
           "Without COMMAND an interactive session starts; with input from a pipe\n"
           "every line is run as a command. Run `memcli help` for the command list.\n";
}

int cli_batch(dispatcher& d, const parsed_args& pa, size_t first, std::ostream& out)
{
    std::string_view word = pa.at(first);
    command_id id;
    if (!resolve_command(word, id))
    {
        out << "Unknown command - " << word << "\n";
        return EXIT_FAILED;
    }
    if (id == cmd_quit)
    {
        out << "Nothing to do with " << word << "\n";
        return EXIT_OK;
    }

    if (d.run(id, pa, first + 1))
        return EXIT_OK;

    const std::string_view name = info_of(id).name;
    out << "Command seems failed. Run `" << d.program() << " help` or `"
        << d.program() << " help " << name << "` for usage.\n";
    return d.last_error_was_connect() ? EXIT_UNREACHABLE : EXIT_FAILED;
}

int cli_lines(dispatcher& d, std::istream& in, std::ostream& out,
              std::string_view prompt, bool interactive)
{
    bool failed = false;
    bool unreachable = false;
    std::string line;
    parsed_args pa;

    while (!g_interactive_quit)
    {
        if (interactive)
            out << prompt << std::flush;

        if (!std::getline(in, line))
        {
            if (interactive && !g_interactive_quit)
                out << "\n";
            break;
        }
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        pa.parse(line);
        if (pa.count == 0)
            continue;

        command_id id;
        if (!resolve_command(pa.args[0], id))
        {
            out << "Unknown command - " << line << "\n";
            failed = true;
            continue;
        }
        if (id == cmd_quit)
            break;

        if (pa.truncated)
        {
            out << "Too many arguments (at most " << MAX_ARGS << ").\n";
            failed = true;
            continue;
        }

        if (!d.run(id, pa, 1))
        {
            out << "Command seems failed. Type \\h " << info_of(id).name << " for help.\n\n";
            failed = true;
            unreachable = unreachable || d.last_error_was_connect();
        }
    }

    if (interactive)
        return EXIT_OK;
    if (unreachable)
        return EXIT_UNREACHABLE;
    return failed ? EXIT_FAILED : EXIT_OK;
}

static int run_session(dispatcher& d, data_source& ds, const logger& log)
{
    bool interactive = isatty(STDIN_FILENO);

    g_interactive_quit = 0;
    struct sigaction sa{};
    sa.sa_handler = interactive_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGQUIT, &sa, nullptr);

    std::string addr = ds.address().to_string();
    MEMCLI_LOG_DEBUG(log, std::string(interactive ? "start interactive mode. " : "start script mode. ") + addr);

    if (interactive)
        std::cout << "Type '\\h' or 'help' to show help.\n\n";

    int rc = cli_lines(d, std::cin, std::cout, "memcached@" + addr + "> ", interactive);

    if (g_interactive_quit)
        std::cerr << "Caught INT or QUIT. Exiting...\n";

    sa.sa_handler = SIG_DFL;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGQUIT, &sa, nullptr);

    MEMCLI_LOG_DEBUG(log, "finish session. " + addr);
    return rc;
}

static bool load_settings(const cli_flags& flags, client_settings& settings)
{
    std::string error;
    if (flags.config_path)
    {
        if (!load_client_config(*flags.config_path, true, settings, error))
        {
            std::cerr << "config: " << error << "\n";
            return false;
        }
    }
    else
    {
        auto paths = memcli_paths::resolve();
        if (!paths.config_path.empty()
            && !load_client_config(paths.config_path.string(), paths.from_env, settings, error))
        {
            std::cerr << "config: " << error << "\n";
            return false;
        }
    }

    apply_cli_flags(flags, settings);
    return true;
}

int cli_main(int argc, char** argv)
{
    parsed_args pa;
    pa.assign(argc, argv, 1);

    cli_flags flags;
    if (parse_cli_flags(pa, flags, std::cerr) != 0)
    {
        std::cerr << "Run `memcli --help` for usage.\n";
        return EXIT_FAILED;
    }

    if (flags.show_help)
    {
        print_usage(std::cout);
        return EXIT_OK;
    }
    if (flags.show_version)
    {
        std::cout << "memcli " << MEMCLI_VERSION << "\n";
        return EXIT_OK;
    }

    client_settings settings;
    if (!load_settings(flags, settings))
        return EXIT_FAILED;

    logger log(settings.level);

    data_source_options opts;
    if (!parse_endpoint(settings.addr, opts.address))
    {
        std::cerr << "invalid address: " << settings.addr << "\n";
        return EXIT_FAILED;
    }
    opts.timeout = std::chrono::milliseconds(settings.timeout_ms);
    opts.tls = settings.tls;
    opts.max_value_size = settings.max_value_size;

    data_source ds(opts, log);
    dispatcher d(ds, std::cout, std::cerr);

    bool batch = flags.command_index < pa.count;
    if (batch)
    {
        MEMCLI_LOG_DEBUG(log, "run batch mode with " + std::string(pa.at(flags.command_index)));

        // help and unknown words need no server
        command_id id;
        if (!resolve_command(pa.at(flags.command_index), id) || id == cmd_help || id == cmd_quit)
            return cli_batch(d, pa, flags.command_index, std::cout);
    }

    mc_error err;
    if (!ds.open(err))
    {
        std::cerr << "Can't connect to Memcached server! Addr=" << opts.address.to_string() << "\n";
        MEMCLI_LOG_DEBUG(log, "ERROR: " + err.message);
        return EXIT_UNREACHABLE;
    }

    if (batch)
        return cli_batch(d, pa, flags.command_index, std::cout);
    return run_session(d, ds, log);
}

} // namespace memcli
