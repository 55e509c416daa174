/**
 * This is the utility module, containing shared utility and helper code: result codes and their messages,
 * the log hook, and small string/number helpers.
 *
 * Coding Conventions & Best Practices:
 * 1. Every public interface method declared in this file should be prefixed with "jqrutil_".
 * 2. Interface methods should not depend on the CLI or on stdio streams, so that unit tests stay simple.
 */
#ifndef JQR_UTIL_H_
#define JQR_UTIL_H_

#include <stddef.h>
#include <stdint.h>
#include <string>

typedef enum {
    JQRUTIL_SUCCESS = 0,
    JQRUTIL_WRONG_NUM_ARGS,
    JQRUTIL_JSON_PARSE_ERROR,
    JQRUTIL_YAML_PARSE_ERROR,
    JQRUTIL_YAML_NON_SCALAR_KEY,
    JQRUTIL_YAML_EMIT_ERROR,
    JQRUTIL_SERIALIZATION_ERROR,
    JQRUTIL_INVALID_JSON_PATH,
    JQRUTIL_PATH_MUST_START_WITH_DOLLAR,
    JQRUTIL_INVALID_MEMBER_NAME,
    JQRUTIL_INVALID_NUMBER,
    JQRUTIL_INVALID_IDENTIFIER,
    JQRUTIL_INVALID_DOT_SEQUENCE,
    JQRUTIL_INVALID_FUNCTION_CALL,
    JQRUTIL_EMPTY_EXPR_TOKEN,
    JQRUTIL_VALUE_NOT_NUMBER,
    JQRUTIL_ARRAY_INDEX_NOT_NUMBER,
    JQRUTIL_STEP_CANNOT_NOT_BE_ZERO,
    JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED,
    JQRUTIL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED,
    JQRUTIL_RECURSIVE_DESCENT_TOKEN_LIMIT_EXCEEDED,
    JQRUTIL_QUERY_STRING_SIZE_LIMIT_EXCEEDED,
    JQRUTIL_FAILED_TO_READ_INPUT,
    JQRUTIL_COMMAND_SYNTAX_ERROR,
    JQRUTIL_UNKNOWN_CONFIG,
    JQRUTIL_INVALID_CONFIG_VALUE,
    JQRUTIL_CONFIG_VALUE_OUT_OF_RANGE,
    JQRUTIL_UNKNOWN_LOG_LEVEL,
    JQRUTIL_LAST
} JqrUtilCode;

/* Pretty print format. A null PrintFormat pointer means compact output (no space, no indent, no newline). */
typedef struct {
    char indent_char;
    unsigned indent_count;
} PrintFormat;

/* Enum for the buffer size used in conversion of double to string the way RapidJSON writes it */
enum { BUF_SIZE_DOUBLE_RAPID_JSON = 25 };

/* Get message for a given code. */
const char *jqrutil_code_to_message(JqrUtilCode code);

/**
 * Convert double to string using the same format as RapidJSON's Writer::WriteDouble does, i.e., the shortest
 * representation that reads back to the same double.
 */
size_t jqrutil_double_to_string_rapidjson(const double val, char *double_to_string_buf_rapidjson, size_t len);

/* Number of Unicode code points in a UTF-8 string. Continuation bytes are not counted. */
size_t jqrutil_utf8_length(const char *s, size_t len);

/* Append a member name or array index to a JSON pointer, escaping '~' and '/' as RFC 6901 requires. */
void jqrutil_append_pointer_token(std::string &pointer, const char *token, size_t len);

/* ============================== Logging ============================== */

/**
 * Log levels, from the most verbose to the least verbose. Messages below the configured level are dropped by
 * the default log sink.
 */
#define JQR_LOG_DEBUG "debug"
#define JQR_LOG_VERBOSE "verbose"
#define JQR_LOG_NOTICE "notice"
#define JQR_LOG_WARNING "warning"

/**
 * The log hook. The default writes "jqr <level>: <message>" to stderr if the level is enabled. Unit tests replace
 * it with a capturing sink.
 */
extern void (*jqr_log)(const char *level, const char *fmt, ...);

/* Set the log level threshold. Returns JQRUTIL_UNKNOWN_LOG_LEVEL if the name is not one of the levels above. */
JqrUtilCode jqrutil_set_log_level(const char *level);
const char *jqrutil_get_log_level();
bool jqrutil_is_log_level_enabled(const char *level);

#endif  // JQR_UTIL_H_
