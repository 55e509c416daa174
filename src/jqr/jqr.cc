#include "jqr/jqr.h"
#include "jqr/match.h"
#include "jqr/selector.h"
#include "jqr/stats.h"
#include "jqr/yaml.h"
#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <cstring>
#include <string>
#include "jqr/rapidjson_includes.h"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

static size_t config_max_path_limit = DEFAULT_MAX_PATH_LIMIT;
static size_t config_max_parser_recursion_depth = DEFAULT_MAX_PARSER_RECURSION_DEPTH;
static size_t config_max_recursive_descent_tokens = DEFAULT_MAX_RECURSIVE_DESCENT_TOKENS;
static size_t config_max_query_string_size = DEFAULT_MAX_QUERY_STRING_SIZE;
static size_t config_indent_size = DEFAULT_INDENT_SIZE;

size_t jqr_get_max_path_limit() {
    return config_max_path_limit;
}

size_t jqr_get_max_parser_recursion_depth() {
    return config_max_parser_recursion_depth;
}

size_t jqr_get_max_recursive_descent_tokens() {
    return config_max_recursive_descent_tokens;
}

size_t jqr_get_max_query_string_size() {
    return config_max_query_string_size;
}

size_t jqr_get_indent_size() {
    return config_indent_size;
}

typedef struct {
    const char *name;
    size_t *value;
    long long default_val;
    long long min;
    long long max;
} NumericConfig;

static NumericConfig numeric_configs[] = {
    {"max-path-limit", &config_max_path_limit, DEFAULT_MAX_PATH_LIMIT, 1, INT_MAX},
    {"max-parser-recursion-depth", &config_max_parser_recursion_depth, DEFAULT_MAX_PARSER_RECURSION_DEPTH,
     1, INT_MAX},
    {"max-recursive-descent-tokens", &config_max_recursive_descent_tokens, DEFAULT_MAX_RECURSIVE_DESCENT_TOKENS,
     0, INT_MAX},
    {"max-query-string-size", &config_max_query_string_size, DEFAULT_MAX_QUERY_STRING_SIZE, 1, INT_MAX},
    {"indent-size", &config_indent_size, DEFAULT_INDENT_SIZE, 0, 16},
};

#define LOG_LEVEL_CONFIG "log-level"

STATIC NumericConfig *find_numeric_config(const char *name) {
    for (auto &config : numeric_configs) {
        if (!strcmp(config.name, name)) return &config;
    }
    return nullptr;
}

JqrUtilCode jqr_config_set(const char *name, const char *value) {
    if (!strcmp(name, LOG_LEVEL_CONFIG)) return jqrutil_set_log_level(value);

    NumericConfig *config = find_numeric_config(name);
    if (config == nullptr) return JQRUTIL_UNKNOWN_CONFIG;

    char *end = nullptr;
    errno = 0;
    long long val = strtoll(value, &end, 10);
    if (*value == '\0' || end == nullptr || *end != '\0') return JQRUTIL_INVALID_CONFIG_VALUE;
    if (errno == ERANGE || val < config->min || val > config->max) return JQRUTIL_CONFIG_VALUE_OUT_OF_RANGE;
    *config->value = static_cast<size_t>(val);
    jqr_log(JQR_LOG_DEBUG, "Config %s is set to %lld", name, val);
    return JQRUTIL_SUCCESS;
}

JqrUtilCode jqr_config_get(const char *name, std::string &value) {
    value.clear();
    if (!strcmp(name, LOG_LEVEL_CONFIG)) {
        value = jqrutil_get_log_level();
        return JQRUTIL_SUCCESS;
    }
    NumericConfig *config = find_numeric_config(name);
    if (config == nullptr) return JQRUTIL_UNKNOWN_CONFIG;
    value = std::to_string(*config->value);
    return JQRUTIL_SUCCESS;
}

void jqr_config_reset() {
    for (auto &config : numeric_configs) {
        *config.value = static_cast<size_t>(config.default_val);
    }
    jqrutil_set_log_level(JQR_LOG_WARNING);
}

/* ============================== Query ============================== */

/**
 * Compile a query. A failure is logged, the caller folds it into the invalid query outcome.
 */
STATIC JqrUtilCode compile_query(const char *query, PathExpression &expr) {
    PathCompiler compiler;
    JqrUtilCode rc = compiler.compile(query, expr);
    if (rc != JQRUTIL_SUCCESS) {
        jqr_log(JQR_LOG_VERBOSE, "Failed to compile JSONPath query \"%s\": %s", query,
                jqrutil_code_to_message(rc));
    }
    return rc;
}

void jqr_extract(const JValue &root, const char *query, QueryResult &result) {
    PathExpression expr;
    JqrUtilCode rc = compile_query(query, expr);
    if (rc != JQRUTIL_SUCCESS) {
        normalize_query(rc, nullptr, result);
        return;
    }
    MatchSequence matches;
    jqr_select(root, expr, matches);
    normalize_query(rc, &matches, result);
}

void jqr_extract_as_array(const JValue &root, const char *query, JValue &out) {
    out.SetNull();
    PathExpression expr;
    JqrUtilCode rc = compile_query(query, expr);
    if (rc != JQRUTIL_SUCCESS) {
        QueryResult result;
        normalize_compile_failure(result);
        query_result_flatten(result, out);
        return;
    }
    MatchSequence matches;
    jqr_select(root, expr, matches);
    normalize_matches_as_array(matches, out);
}

void jqr_extract_jsonpath(const JValue &root, const char *query, JValue &out) {
    QueryResult result;
    jqr_extract(root, query, result);
    query_result_flatten(result, out);
}

/* ============================== Text in, text out ============================== */

STATIC JqrUtilCode serialize_pretty(const JValue &val, std::string &output) {
    output.clear();
    PrintFormat format = {' ', static_cast<unsigned>(jqr_get_indent_size())};
    rapidjson::StringBuffer oss;
    JqrUtilCode rc = dom_serialize_value(val, &format, oss);
    if (rc != JQRUTIL_SUCCESS) return rc;
    output.assign(oss.GetString(), oss.GetSize());
    jqrstats_update_stats_on_output(output.length());
    return JQRUTIL_SUCCESS;
}

JqrUtilCode jqr_pretty_print_json(const char *content, const size_t len, const char *query, const bool as_array,
                                  std::string &output, std::string &err_msg) {
    output.clear();
    err_msg.clear();

    JDocument *doc;
    JqrUtilCode rc = dom_parse(content, len, &doc, &err_msg);
    if (rc != JQRUTIL_SUCCESS) return rc;

    if (query == nullptr) {
        rc = serialize_pretty(doc->GetJValue(), output);
    } else {
        JValue result;
        if (as_array)
            jqr_extract_as_array(doc->GetJValue(), query, result);
        else
            jqr_extract_jsonpath(doc->GetJValue(), query, result);
        rc = serialize_pretty(result, output);
    }
    dom_free_doc(doc);

    if (rc != JQRUTIL_SUCCESS) err_msg = std::string("Serialization error: ") + jqrutil_code_to_message(rc);
    return rc;
}

JqrUtilCode jqr_convert_to_yaml(const char *content, const size_t len, std::string &output, std::string &err_msg) {
    output.clear();
    err_msg.clear();

    JDocument *doc;
    JqrUtilCode rc = dom_parse(content, len, &doc, &err_msg);
    if (rc != JQRUTIL_SUCCESS) return rc;

    rc = yamlconv_emit_value(doc->GetJValue(), output);
    dom_free_doc(doc);
    if (rc != JQRUTIL_SUCCESS) err_msg = jqrutil_code_to_message(rc);
    return rc;
}

JqrUtilCode jqr_convert_to_json(const char *content, const size_t len, std::string &output, std::string &err_msg) {
    output.clear();
    err_msg.clear();

    JDocument *doc;
    std::string reason;
    JqrUtilCode rc = yamlconv_parse(content, len, &doc, &reason);
    if (rc != JQRUTIL_SUCCESS) {
        err_msg = "Invalid YAML: " + reason;
        return rc;
    }

    rc = serialize_pretty(doc->GetJValue(), output);
    dom_free_doc(doc);
    if (rc != JQRUTIL_SUCCESS) err_msg = std::string("Serialization error: ") + jqrutil_code_to_message(rc);
    return rc;
}
