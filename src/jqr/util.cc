#include "jqr/util.h"
#include <stdarg.h>
#include <stdio.h>
#include <cstring>
#include <string>
#include "jqr/rapidjson_includes.h"

const char *jqrutil_code_to_message(JqrUtilCode code) {
    switch (code) {
        case JQRUTIL_SUCCESS:
        case JQRUTIL_WRONG_NUM_ARGS:
            // only used as code, no message needed
            break;
        case JQRUTIL_JSON_PARSE_ERROR: return "SYNTAXERR Failed to parse JSON string due to syntax error";
        case JQRUTIL_YAML_PARSE_ERROR: return "YAMLERR Failed to parse YAML string";
        case JQRUTIL_YAML_NON_SCALAR_KEY: return "YAMLERR Mapping key is not a scalar";
        case JQRUTIL_YAML_EMIT_ERROR: return "YAMLERR Failed to emit YAML";
        case JQRUTIL_SERIALIZATION_ERROR: return "SERIALIZATIONERR Value cannot be serialized as JSON";
        case JQRUTIL_INVALID_JSON_PATH: return "SYNTAXERR Invalid JSON path";
        case JQRUTIL_PATH_MUST_START_WITH_DOLLAR: return "SYNTAXERR JSON path must start with '$'";
        case JQRUTIL_INVALID_MEMBER_NAME: return "SYNTAXERR Invalid object member name";
        case JQRUTIL_INVALID_NUMBER: return "SYNTAXERR Invalid number";
        case JQRUTIL_INVALID_IDENTIFIER: return "SYNTAXERR Invalid identifier";
        case JQRUTIL_INVALID_DOT_SEQUENCE: return "SYNTAXERR Invalid dot sequence";
        case JQRUTIL_INVALID_FUNCTION_CALL: return "SYNTAXERR length() must be the last element of the path";
        case JQRUTIL_EMPTY_EXPR_TOKEN: return "SYNTAXERR Expression token cannot be empty";
        case JQRUTIL_VALUE_NOT_NUMBER: return "WRONGTYPE Value is not a number";
        case JQRUTIL_ARRAY_INDEX_NOT_NUMBER: return "SYNTAXERR Array index is not a number";
        case JQRUTIL_STEP_CANNOT_NOT_BE_ZERO: return "SYNTAXERR Step in the slice cannot be zero";
        case JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED:
            return "LIMIT Document path nesting limit is exceeded";
        case JQRUTIL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED:
            return "LIMIT Parser recursion depth is exceeded";
        case JQRUTIL_RECURSIVE_DESCENT_TOKEN_LIMIT_EXCEEDED:
            return "LIMIT Total number of recursive descent tokens in the query string exceeds the limit";
        case JQRUTIL_QUERY_STRING_SIZE_LIMIT_EXCEEDED:
            return "LIMIT Query string size limit is exceeded";
        case JQRUTIL_FAILED_TO_READ_INPUT: return "IOERR Failed to read input";
        case JQRUTIL_COMMAND_SYNTAX_ERROR: return "SYNTAXERR Command syntax error";
        case JQRUTIL_UNKNOWN_CONFIG: return "ERR Unknown config name";
        case JQRUTIL_INVALID_CONFIG_VALUE: return "ERR Config value is not an integer";
        case JQRUTIL_CONFIG_VALUE_OUT_OF_RANGE: return "ERR Config value is out of range";
        case JQRUTIL_UNKNOWN_LOG_LEVEL: return "ERR Unknown log level";
        default: break;
    }
    return "";
}

size_t jqrutil_double_to_string_rapidjson(const double val, char *double_to_string_buf_rapidjson, size_t len) {
    // RapidJSON's Writer::WriteDouble only uses a buffer of 25 bytes.
    if (len < BUF_SIZE_DOUBLE_RAPID_JSON) {
        if (len > 0) double_to_string_buf_rapidjson[0] = '\0';
        return 0;
    }
    char *end = rapidjson::internal::dtoa(val, double_to_string_buf_rapidjson,
                                          rapidjson::Writer<rapidjson::StringBuffer>::kDefaultMaxDecimalPlaces);
    *end = '\0';
    return end - double_to_string_buf_rapidjson;
}

size_t jqrutil_utf8_length(const char *s, size_t len) {
    size_t count = 0;
    for (size_t i = 0; i < len; i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) count++;
    }
    return count;
}

void jqrutil_append_pointer_token(std::string &pointer, const char *token, size_t len) {
    pointer.push_back('/');
    for (size_t i = 0; i < len; i++) {
        switch (token[i]) {
            case '~':
                pointer.append("~0");
                break;
            case '/':
                pointer.append("~1");
                break;
            default:
                pointer.push_back(token[i]);
                break;
        }
    }
}

/* ============================== Logging ============================== */

static const char *log_levels[] = {JQR_LOG_DEBUG, JQR_LOG_VERBOSE, JQR_LOG_NOTICE, JQR_LOG_WARNING};
static const int NUM_LOG_LEVELS = sizeof(log_levels) / sizeof(log_levels[0]);

// index into log_levels
static int log_level_threshold = 3;

static int find_log_level(const char *level) {
    for (int i = 0; i < NUM_LOG_LEVELS; i++) {
        if (!strcmp(level, log_levels[i])) return i;
    }
    return -1;
}

JqrUtilCode jqrutil_set_log_level(const char *level) {
    int idx = find_log_level(level);
    if (idx < 0) return JQRUTIL_UNKNOWN_LOG_LEVEL;
    log_level_threshold = idx;
    return JQRUTIL_SUCCESS;
}

const char *jqrutil_get_log_level() {
    return log_levels[log_level_threshold];
}

bool jqrutil_is_log_level_enabled(const char *level) {
    int idx = find_log_level(level);
    return idx >= log_level_threshold;
}

static void default_log(const char *level, const char *fmt, ...) {
    if (!jqrutil_is_log_level_enabled(level)) return;
    va_list ap;
    va_start(ap, fmt);
    fprintf(stderr, "jqr %s: ", level);
    vfprintf(stderr, fmt, ap);
    fputc('\n', stderr);
    va_end(ap);
}

void (*jqr_log)(const char *level, const char *fmt, ...) = default_log;
