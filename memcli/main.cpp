#include <csignal>

#include "cli/cli.h"

int main(int argc, char** argv)
{
    signal(SIGPIPE, SIG_IGN);
    return memcli::cli_main(argc, argv);
}
