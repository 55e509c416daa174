#include "jqr/cli.h"
#include "jqr/jqr.h"
#include <errno.h>
#include <stdio.h>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

#define ANSI_RED "\x1b[31m"
#define ANSI_RESET "\x1b[0m"

#define INVALID_JSON_PREFIX "Invalid JSON: "
#define INVALID_YAML_PREFIX "Invalid YAML: "

#define USAGE_LINE "Usage: jqr [OPTIONS] [FILE] [QUERY]"

STATIC bool is_option(const char *arg, const char *short_name, const char *long_name) {
    return (short_name != nullptr && !strcmp(arg, short_name)) || !strcmp(arg, long_name);
}

/* Parse "name=value" into the list of configs. */
STATIC JqrUtilCode parseConfigArg(const char *arg, CliArgs *args) {
    const char *eq = strchr(arg, '=');
    if (eq == nullptr || eq == arg) {
        args->error = arg;
        return JQRUTIL_COMMAND_SYNTAX_ERROR;
    }
    args->configs.emplace_back(std::string(arg, eq - arg), std::string(eq + 1));
    return JQRUTIL_SUCCESS;
}

JqrUtilCode parseCliArgs(const int argc, const char **argv, CliArgs *args) {
    *args = CliArgs();
    args->no_args = (argc <= 1);

    int num_positionals = 0;
    bool options_ended = false;
    for (int i = 1; i < argc; i++) {
        const char *arg = argv[i];
        if (options_ended || arg[0] != '-' || !strcmp(arg, "-")) {
            // positional argument: FILE first, then QUERY
            if (num_positionals == 0) {
                args->file = arg;
            } else if (num_positionals == 1) {
                args->query = arg;
            } else {
                args->error = arg;
                return JQRUTIL_WRONG_NUM_ARGS;
            }
            num_positionals++;
        } else if (!strcmp(arg, "--")) {
            options_ended = true;
        } else if (is_option(arg, nullptr, "--to-yaml")) {
            args->to_yaml = true;
        } else if (is_option(arg, nullptr, "--to-json")) {
            args->to_json = true;
        } else if (is_option(arg, nullptr, "--array")) {
            args->as_array = true;
        } else if (is_option(arg, "-h", "--help")) {
            args->help = true;
        } else if (is_option(arg, "-V", "--version")) {
            args->version = true;
        } else if (is_option(arg, "-v", "--verbose")) {
            args->verbosity++;
        } else if (!strcmp(arg, "-vv")) {
            args->verbosity += 2;
        } else if (is_option(arg, "-c", "--config")) {
            if (i == argc - 1) {
                args->error = arg;
                return JQRUTIL_COMMAND_SYNTAX_ERROR;
            }
            JqrUtilCode rc = parseConfigArg(argv[++i], args);
            if (rc != JQRUTIL_SUCCESS) return rc;
        } else if (!strncmp(arg, "--config=", 9)) {
            JqrUtilCode rc = parseConfigArg(arg + 9, args);
            if (rc != JQRUTIL_SUCCESS) return rc;
        } else {
            args->error = arg;
            return JQRUTIL_COMMAND_SYNTAX_ERROR;
        }
    }
    return JQRUTIL_SUCCESS;
}

void cli_print_help(std::ostream &out) {
    out << "Pretty-print and query JSON data\n"
        << "\n"
        << USAGE_LINE << "\n"
        << "\n"
        << "Arguments:\n"
        << "  [FILE]   Path to JSON file. If omitted, reads from stdin.\n"
        << "  [QUERY]  JSONPath query (e.g., '$.user.name')\n"
        << "\n"
        << "Options:\n"
        << "      --to-yaml\n"
        << "          Convert JSON to YAML\n"
        << "      --to-json\n"
        << "          Convert YAML to JSON\n"
        << "      --array\n"
        << "          Print query results as an array, whatever their number\n"
        << "  -c, --config <NAME=VALUE>\n"
        << "          Set a config parameter. Can be given more than once:\n"
        << "            max-path-limit                maximum nesting depth of the input [default: "
        << DEFAULT_MAX_PATH_LIMIT << "]\n"
        << "            max-parser-recursion-depth    maximum nesting of a query [default: "
        << DEFAULT_MAX_PARSER_RECURSION_DEPTH << "]\n"
        << "            max-recursive-descent-tokens  maximum number of '..' in a query [default: "
        << DEFAULT_MAX_RECURSIVE_DESCENT_TOKENS << "]\n"
        << "            max-query-string-size         maximum length of a query [default: "
        << DEFAULT_MAX_QUERY_STRING_SIZE << "]\n"
        << "            indent-size                   indent of the JSON output [default: "
        << DEFAULT_INDENT_SIZE << "]\n"
        << "            log-level                     debug, verbose, notice or warning [default: warning]\n"
        << "  -v, --verbose\n"
        << "          Log at verbose level, twice for debug level\n"
        << "  -h, --help\n"
        << "          Print help\n"
        << "  -V, --version\n"
        << "          Print version\n";
}

STATIC void print_usage_error(const std::string &msg, std::ostream &err) {
    err << "error: " << msg << "\n\n" << USAGE_LINE << "\n\nFor more information, try '--help'.\n";
}

/* Paint the part of msg after prefix red. If msg does not start with prefix, all of it is painted. */
STATIC std::string paint(const std::string &msg, const char *prefix, const bool color) {
    if (!color) return msg;
    size_t prefix_len = strlen(prefix);
    if (msg.compare(0, prefix_len, prefix) != 0) prefix_len = 0;
    return msg.substr(0, prefix_len) + ANSI_RED + msg.substr(prefix_len) + ANSI_RESET;
}

STATIC JqrUtilCode read_file(const char *path, std::string &content, std::string &err_msg) {
    content.clear();
    FILE *fp = fopen(path, "rb");
    if (fp == nullptr) {
        err_msg = strerror(errno);
        return JQRUTIL_FAILED_TO_READ_INPUT;
    }
    char buf[64 * 1024];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) {
        content.append(buf, n);
    }
    bool failed = ferror(fp) != 0;
    int saved_errno = errno;
    fclose(fp);
    if (failed) {
        err_msg = strerror(saved_errno);
        return JQRUTIL_FAILED_TO_READ_INPUT;
    }
    return JQRUTIL_SUCCESS;
}

STATIC JqrUtilCode read_stream(std::istream &in, std::string &content) {
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) return JQRUTIL_FAILED_TO_READ_INPUT;
    return JQRUTIL_SUCCESS;
}

STATIC JqrUtilCode apply_settings(const CliArgs &args, std::string &err_msg) {
    if (args.verbosity == 1) jqrutil_set_log_level(JQR_LOG_VERBOSE);
    if (args.verbosity > 1) jqrutil_set_log_level(JQR_LOG_DEBUG);
    for (auto &config : args.configs) {
        JqrUtilCode rc = jqr_config_set(config.first.c_str(), config.second.c_str());
        if (rc != JQRUTIL_SUCCESS) {
            err_msg = "invalid value '" + config.first + "=" + config.second + "' for '--config': " +
                      jqrutil_code_to_message(rc);
            return rc;
        }
    }
    return JQRUTIL_SUCCESS;
}

int cli_main(const int argc, const char **argv, std::istream &in, std::ostream &out, std::ostream &err,
             const bool color) {
    CliArgs args;
    JqrUtilCode rc = parseCliArgs(argc, argv, &args);
    if (rc == JQRUTIL_WRONG_NUM_ARGS) {
        print_usage_error("unexpected argument '" + args.error + "' found", err);
        return 2;
    } else if (rc != JQRUTIL_SUCCESS) {
        print_usage_error("unexpected or malformed argument '" + args.error + "'", err);
        return 2;
    }

    if (args.no_args || args.help) {
        cli_print_help(out);
        return 0;
    }
    if (args.version) {
        out << "jqr " << JQR_VERSION << "\n";
        return 0;
    }
    if (args.to_yaml && args.to_json) {
        print_usage_error("the argument '--to-yaml' cannot be used with '--to-json'", err);
        return 2;
    }

    std::string err_msg;
    rc = apply_settings(args, err_msg);
    if (rc != JQRUTIL_SUCCESS) {
        print_usage_error(err_msg, err);
        return 2;
    }

    std::string content;
    if (args.file != nullptr && strcmp(args.file, "-") != 0) {
        rc = read_file(args.file, content, err_msg);
        if (rc != JQRUTIL_SUCCESS) {
            err << "Error reading file: " << err_msg << "\n";
            return 0;
        }
    } else {
        rc = read_stream(in, content);
        if (rc != JQRUTIL_SUCCESS) {
            err << "Failed to read from stdin\n";
            return 0;
        }
    }

    std::string output;
    if (args.to_yaml) {
        rc = jqr_convert_to_yaml(content.data(), content.length(), output, err_msg);
        if (rc != JQRUTIL_SUCCESS) {
            err << "Error converting to YAML: " << paint(err_msg, INVALID_JSON_PREFIX, color) << "\n";
            return 0;
        }
    } else if (args.to_json) {
        rc = jqr_convert_to_json(content.data(), content.length(), output, err_msg);
        if (rc != JQRUTIL_SUCCESS) {
            if (rc == JQRUTIL_SERIALIZATION_ERROR)
                err << err_msg << "\n";
            else
                err << paint(err_msg, INVALID_YAML_PREFIX, color) << "\n";
            return 0;
        }
    } else {
        rc = jqr_pretty_print_json(content.data(), content.length(), args.query, args.as_array, output, err_msg);
        if (rc != JQRUTIL_SUCCESS) {
            err << "Error processing JSON: " << (rc == JQRUTIL_SERIALIZATION_ERROR ? err_msg :
                                                 paint(err_msg, "", color)) << "\n";
            return 0;
        }
    }
    out << output << "\n";
    return 0;
}
