/**
 * The command line of jqr:
 *
 *   jqr [OPTIONS] [FILE] [QUERY]
 *
 * Arguments processing is separated out into the CliArgs struct and parseCliArgs, so that it can be tested
 * without running anything. cli_main takes the standard streams as parameters for the same reason.
 */
#ifndef JQR_CLI_H_
#define JQR_CLI_H_

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>
#include "jqr/util.h"

typedef struct {
    const char *file;    // optional, nullptr or "-" reads stdin
    const char *query;   // optional
    bool to_yaml;
    bool to_json;
    bool as_array;
    bool help;
    bool version;
    bool no_args;        // nothing at all was given on the command line
    int verbosity;       // number of -v flags
    std::vector<std::pair<std::string, std::string>> configs;  // --config name=value, in order
    std::string error;   // offending argument if parsing failed
} CliArgs;

/**
 * Parse the command line.
 * @param args - OUTPUT param.
 * @return JQRUTIL_SUCCESS, JQRUTIL_COMMAND_SYNTAX_ERROR for an unknown option or a malformed option value,
 *         JQRUTIL_WRONG_NUM_ARGS for more than two positional arguments.
 */
JqrUtilCode parseCliArgs(const int argc, const char **argv, CliArgs *args);

/* Print the long help text. */
void cli_print_help(std::ostream &out);

/**
 * Run jqr.
 * @param color - paint the reason of an input error red.
 * @return exit status: 0 once the input has been processed, whether or not an error was reported,
 *         2 for a usage error.
 */
int cli_main(const int argc, const char **argv, std::istream &in, std::ostream &out, std::ostream &err,
             const bool color);

#endif  // JQR_CLI_H_
