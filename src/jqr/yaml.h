/**
 * YAML conversion of JSON values. yaml-cpp does the YAML text work; this module maps between yaml-cpp nodes and
 * JValues.
 *
 * Reading YAML, plain scalars are resolved to a JSON type:
 *   null:   "", "~", "null", "Null", "NULL"
 *   bool:   "true", "True", "TRUE", "false", "False", "FALSE"
 *   int:    decimal, "0x" hexadecimal or "0o" octal. Integers beyond 64 bits become doubles.
 *   float:  decimal with fraction or exponent, ".inf", "-.inf", ".nan" and their case variants
 *   string: anything else.
 * Quoted scalars and scalars tagged "!!str" are always strings. Mapping keys must be scalars.
 *
 * Writing YAML, a string that would read back as another type is double quoted.
 *
 * Every public interface method declared in this file is prefixed with "yamlconv_".
 */
#ifndef JQR_YAML_H_
#define JQR_YAML_H_

#include <string>
#include "jqr/dom.h"
#include "jqr/util.h"

typedef enum {
    YAMLCONV_SCALAR_NULL = 0,
    YAMLCONV_SCALAR_BOOL,
    YAMLCONV_SCALAR_INT,
    YAMLCONV_SCALAR_FLOAT,
    YAMLCONV_SCALAR_STRING
} YamlScalarType;

/* Which JSON type a plain (unquoted, untagged) scalar resolves to. */
YamlScalarType yamlconv_classify_plain_scalar(const std::string &s);

/**
 * Parse YAML text into a document. Only the first YAML document of the stream is read.
 * @param doc - OUTPUT param. The caller is responsible for calling dom_free_doc(JDocument*) after it's consumed.
 * @param err_msg - OUTPUT param, optional. On failure it receives the reason, e.g.
 *        "did not find expected key at line 3 column 1".
 * @return JQRUTIL_SUCCESS, JQRUTIL_YAML_PARSE_ERROR, JQRUTIL_YAML_NON_SCALAR_KEY or
 *         JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED.
 */
JqrUtilCode yamlconv_parse(const char *yaml_buf, const size_t buf_len, JDocument **doc,
                           std::string *err_msg = nullptr);

/**
 * Emit a value as block style YAML.
 * @param output - OUTPUT param, receives the YAML text without a trailing newline.
 */
JqrUtilCode yamlconv_emit_value(const JValue &val, std::string &output);

#endif  // JQR_YAML_H_
