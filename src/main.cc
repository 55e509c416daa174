#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <iostream>
#include "jqr/cli.h"
#include "jqr/stats.h"

int main(int argc, char **argv) {
    bool color = isatty(fileno(stderr)) && getenv("NO_COLOR") == nullptr;
    int status = cli_main(argc, const_cast<const char **>(argv), std::cin, std::cout, std::cerr, color);
    std::cout.flush();
    jqrstats_log_summary();
    return status;
}
