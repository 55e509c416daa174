/**
 * The jqr facade: configuration and the operations the command line is made of.
 *
 *   jqr_pretty_print_json   parse JSON text, optionally run a query, print the result as indented JSON
 *   jqr_extract_jsonpath    run a query against a value and fold the outcome into one JSON value
 *   jqr_convert_to_yaml     JSON text to YAML text
 *   jqr_convert_to_json     YAML text to indented JSON text
 *
 * Design Considerations:
 * 1. Parsing and serialization are delegated to the DOM module, YAML to the YAML module.
 * 2. A query that does not compile is not an error at this level. It folds into the "Invalid JSONPath query"
 *    sentinel, and the compile error is logged at verbose level.
 * 3. Configuration is a set of numeric parameters, each with a default and a valid range, addressed by name.
 *
 * Coding Conventions & Best Practices:
 * 1. Every public interface method declared in this file is prefixed with "jqr_".
 * 2. Output parameters are placed at the end, and are initialized at the beginning of the method.
 */
#ifndef JQR_JQR_H_
#define JQR_JQR_H_

#include <string>
#include "jqr/dom.h"
#include "jqr/normalize.h"
#include "jqr/util.h"

#define JQR_VERSION "0.1.0"

#define DEFAULT_MAX_PATH_LIMIT 128
#define DEFAULT_MAX_PARSER_RECURSION_DEPTH 200
#define DEFAULT_MAX_RECURSIVE_DESCENT_TOKENS 20
#define DEFAULT_MAX_QUERY_STRING_SIZE (128 * 1024)  // 128KB
#define DEFAULT_INDENT_SIZE 2

/* ============================== Configuration ============================== */

size_t jqr_get_max_path_limit();
size_t jqr_get_max_parser_recursion_depth();
size_t jqr_get_max_recursive_descent_tokens();
size_t jqr_get_max_query_string_size();
size_t jqr_get_indent_size();

/**
 * Set a config param by name. Besides the numeric params, "log-level" accepts one of the log level names.
 * @return JQRUTIL_UNKNOWN_CONFIG, JQRUTIL_INVALID_CONFIG_VALUE, JQRUTIL_CONFIG_VALUE_OUT_OF_RANGE or
 *         JQRUTIL_UNKNOWN_LOG_LEVEL on failure.
 */
JqrUtilCode jqr_config_set(const char *name, const char *value);

/**
 * Get a config param by name.
 * @param value - OUTPUT param, the current value as text.
 */
JqrUtilCode jqr_config_get(const char *name, std::string &value);

/* Restore every config param to its default. */
void jqr_config_reset();

/* ============================== Operations ============================== */

/**
 * Compile and run a query against a value.
 * @param result - OUTPUT param, the folded outcome. INVALID_QUERY if the query does not compile.
 */
void jqr_extract(const JValue &root, const char *query, QueryResult &result);

/**
 * Compile and run a query against a value, the result is always an array. A query that does not compile gives
 * the "Invalid JSONPath query" string.
 */
void jqr_extract_as_array(const JValue &root, const char *query, JValue &out);

/**
 * Compile and run a query against a value, and flatten the outcome into one JSON value:
 * the single match, an array of matches, "No results found" or "Invalid JSONPath query".
 */
void jqr_extract_jsonpath(const JValue &root, const char *query, JValue &out);

/**
 * Parse JSON text and print it indented, or print the outcome of a query against it.
 * @param query - optional, nullptr prints the document itself.
 * @param as_array - print query results as an array whatever their number.
 * @param output - OUTPUT param, the indented JSON text without a trailing newline.
 * @param err_msg - OUTPUT param, on failure the reason, e.g. "Invalid JSON: Invalid value. (at offset 0)".
 * @return JQRUTIL_SUCCESS, an input parse error, or JQRUTIL_SERIALIZATION_ERROR.
 */
JqrUtilCode jqr_pretty_print_json(const char *content, const size_t len, const char *query, const bool as_array,
                                  std::string &output, std::string &err_msg);

/**
 * Convert JSON text to YAML text.
 * @param output - OUTPUT param, the YAML text without a trailing newline.
 * @param err_msg - OUTPUT param, on failure the reason.
 */
JqrUtilCode jqr_convert_to_yaml(const char *content, const size_t len, std::string &output, std::string &err_msg);

/**
 * Convert YAML text to indented JSON text.
 * @param output - OUTPUT param, the JSON text without a trailing newline.
 * @param err_msg - OUTPUT param, on failure the reason, e.g. "Invalid YAML: did not find expected key at line 3
 *        column 1".
 */
JqrUtilCode jqr_convert_to_json(const char *content, const size_t len, std::string &output, std::string &err_msg);

#endif  // JQR_JQR_H_
