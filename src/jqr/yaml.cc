#include "jqr/yaml.h"
#include "jqr/jqr.h"
#include "jqr/stats.h"
#include <yaml-cpp/yaml.h>
#include <errno.h>
#include <stdlib.h>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>
#include <algorithm>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

#define YAML_STR_TAG "tag:yaml.org,2002:str"
#define YAML_NON_SPECIFIC_TAG "!"

/* ============================== Scalar resolution ============================== */

STATIC bool is_digits(const std::string &s, size_t pos, const char *valid_chars) {
    if (pos >= s.length()) return false;
    return s.find_first_not_of(valid_chars, pos) == std::string::npos;
}

STATIC size_t skip_sign(const std::string &s) {
    return (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
}

STATIC bool is_decimal_int(const std::string &s) {
    return is_digits(s, skip_sign(s), "0123456789");
}

STATIC bool is_hex_int(const std::string &s) {
    return s.length() > 2 && s[0] == '0' && s[1] == 'x' && is_digits(s, 2, "0123456789abcdefABCDEF");
}

STATIC bool is_octal_int(const std::string &s) {
    return s.length() > 2 && s[0] == '0' && s[1] == 'o' && is_digits(s, 2, "01234567");
}

STATIC bool is_infinity(const std::string &s) {
    std::string body = s.substr(skip_sign(s));
    return body == ".inf" || body == ".Inf" || body == ".INF";
}

STATIC bool is_nan(const std::string &s) {
    return s == ".nan" || s == ".NaN" || s == ".NAN";
}

/**
 * [-+]? ( "." [0-9]+ | [0-9]+ ( "." [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
 */
STATIC bool is_decimal_float(const std::string &s) {
    size_t i = skip_sign(s);
    size_t int_digits = 0;
    size_t frac_digits = 0;
    while (i < s.length() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        i++;
        int_digits++;
    }
    if (i < s.length() && s[i] == '.') {
        i++;
        while (i < s.length() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            i++;
            frac_digits++;
        }
    }
    if (int_digits == 0 && frac_digits == 0) return false;
    if (i < s.length() && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < s.length() && (s[i] == '+' || s[i] == '-')) i++;
        size_t exp_digits = 0;
        while (i < s.length() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            i++;
            exp_digits++;
        }
        if (exp_digits == 0) return false;
    }
    return i == s.length();
}

YamlScalarType yamlconv_classify_plain_scalar(const std::string &s) {
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL")
        return YAMLCONV_SCALAR_NULL;
    if (s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" || s == "FALSE")
        return YAMLCONV_SCALAR_BOOL;
    if (is_decimal_int(s) || is_hex_int(s) || is_octal_int(s))
        return YAMLCONV_SCALAR_INT;
    if (is_decimal_float(s) || is_infinity(s) || is_nan(s))
        return YAMLCONV_SCALAR_FLOAT;
    return YAMLCONV_SCALAR_STRING;
}

STATIC double digits_to_double(const std::string &digits, const int base) {
    double d = 0;
    for (char c : digits) {
        int digit = std::isdigit(static_cast<unsigned char>(c)) ? c - '0' :
                    std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        d = d * base + digit;
    }
    return d;
}

STATIC void set_int(const std::string &s, JValue &v) {
    if (is_hex_int(s) || is_octal_int(s)) {
        int base = (s[1] == 'x' ? 16 : 8);
        std::string digits = s.substr(2);
        errno = 0;
        unsigned long long u = strtoull(digits.c_str(), nullptr, base);
        if (errno == ERANGE)
            v.SetDouble(digits_to_double(digits, base));
        else
            v.SetUint64(u);
        return;
    }

    errno = 0;
    long long i = strtoll(s.c_str(), nullptr, 10);
    if (errno != ERANGE) {
        v.SetInt64(i);
        return;
    }
    if (s[0] != '-') {
        errno = 0;
        unsigned long long u = strtoull(s.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            v.SetUint64(u);
            return;
        }
    }
    v.SetDouble(strtod(s.c_str(), nullptr));
}

STATIC void set_float(const std::string &s, JValue &v) {
    if (is_nan(s)) {
        v.SetDouble(std::numeric_limits<double>::quiet_NaN());
    } else if (is_infinity(s)) {
        double inf = std::numeric_limits<double>::infinity();
        v.SetDouble(s[0] == '-' ? -inf : inf);
    } else {
        v.SetDouble(strtod(s.c_str(), nullptr));
    }
}

STATIC void set_string(const std::string &s, JValue &v) {
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.length()), allocator);
}

STATIC void convert_scalar(const YAML::Node &node, JValue &v) {
    const std::string &s = node.Scalar();
    const std::string &tag = node.Tag();
    if (tag == YAML_NON_SPECIFIC_TAG || tag == YAML_STR_TAG) {
        set_string(s, v);
        return;
    }
    switch (yamlconv_classify_plain_scalar(s)) {
        case YAMLCONV_SCALAR_NULL:
            v.SetNull();
            break;
        case YAMLCONV_SCALAR_BOOL:
            v.SetBool(s[0] == 't' || s[0] == 'T');
            break;
        case YAMLCONV_SCALAR_INT:
            set_int(s, v);
            break;
        case YAMLCONV_SCALAR_FLOAT:
            set_float(s, v);
            break;
        case YAMLCONV_SCALAR_STRING:
            set_string(s, v);
            break;
    }
}

/* ============================== YAML to JSON ============================== */

/**
 * Recursive converter from a yaml-cpp node tree to a JValue tree. Nesting is bounded by the max-path-limit config,
 * which is the same limit JSON input is subject to.
 */
struct YamlToJson {
    YamlToJson() : limit(jqr_get_max_path_limit()), max_depth(0), err_msg() {}

    JqrUtilCode convert(const YAML::Node &node, const size_t depth, JValue &v) {
        v.SetNull();
        switch (node.Type()) {
            case YAML::NodeType::Undefined:
            case YAML::NodeType::Null:
                return JQRUTIL_SUCCESS;
            case YAML::NodeType::Scalar:
                convert_scalar(node, v);
                return JQRUTIL_SUCCESS;
            case YAML::NodeType::Sequence: {
                if (depth + 1 > limit) return depth_exceeded(node);
                max_depth = std::max(max_depth, depth + 1);
                v.SetArray();
                for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                    JValue elem;
                    JqrUtilCode rc = convert(*it, depth + 1, elem);
                    if (rc != JQRUTIL_SUCCESS) return rc;
                    v.PushBack(elem, allocator);
                }
                return JQRUTIL_SUCCESS;
            }
            case YAML::NodeType::Map: {
                if (depth + 1 > limit) return depth_exceeded(node);
                max_depth = std::max(max_depth, depth + 1);
                v.SetObject();
                for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                    const YAML::Node &key = it->first;
                    std::string name;
                    if (key.Type() == YAML::NodeType::Scalar) {
                        name = key.Scalar();
                    } else if (key.Type() == YAML::NodeType::Null) {
                        name = "null";
                    } else {
                        err_msg = format_mark("mapping key is not a scalar", key.Mark());
                        return JQRUTIL_YAML_NON_SCALAR_KEY;
                    }
                    JValue jkey(rapidjson::StringRef(name.c_str(), name.length()));
                    if (v.FindMember(jkey) != v.MemberEnd()) {
                        err_msg = format_mark("duplicate entry with key \"" + name + "\"", key.Mark());
                        return JQRUTIL_YAML_PARSE_ERROR;
                    }
                    JValue member;
                    JqrUtilCode rc = convert(it->second, depth + 1, member);
                    if (rc != JQRUTIL_SUCCESS) return rc;
                    JValue owned_key;
                    set_string(name, owned_key);
                    v.AddMember(owned_key, member, allocator);
                }
                return JQRUTIL_SUCCESS;
            }
        }
        return JQRUTIL_SUCCESS;
    }

    static std::string format_mark(const std::string &msg, const YAML::Mark &mark) {
        if (mark.is_null()) return msg;
        return msg + " at line " + std::to_string(mark.line + 1) + " column " + std::to_string(mark.column + 1);
    }

    size_t limit;
    size_t max_depth;
    std::string err_msg;

 private:
    JqrUtilCode depth_exceeded(const YAML::Node &node) {
        err_msg = format_mark(jqrutil_code_to_message(JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED), node.Mark());
        jqr_log(JQR_LOG_VERBOSE, "Document path limit is exceeded. The input has more than %zu nesting levels.",
                limit);
        return JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED;
    }
};

JqrUtilCode yamlconv_parse(const char *yaml_buf, const size_t buf_len, JDocument **doc, std::string *err_msg) {
    *doc = nullptr;
    if (err_msg != nullptr) err_msg->clear();

    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_buf, buf_len));
    } catch (const YAML::Exception &e) {
        if (err_msg != nullptr) *err_msg = YamlToJson::format_mark(e.msg, e.mark);
        jqr_log(JQR_LOG_VERBOSE, "Failed to parse YAML: %s", e.what());
        return JQRUTIL_YAML_PARSE_ERROR;
    }

    YamlToJson converter;
    JValue v;
    int64_t begin_val = jqrstats_begin_track_mem();
    JqrUtilCode rc = converter.convert(root, 0, v);
    int64_t delta = jqrstats_end_track_mem(begin_val);
    if (rc != JQRUTIL_SUCCESS) {
        if (err_msg != nullptr) *err_msg = converter.err_msg;
        return rc;
    }

    *doc = new JDocument();
    (*doc)->SetJValue(v);
    dom_set_doc_size(*doc, (delta > 0 ? static_cast<size_t>(delta) : 0) + sizeof(JValue));
    jqrstats_update_stats_on_parse(buf_len, converter.max_depth);
    return JQRUTIL_SUCCESS;
}

/* ============================== JSON to YAML ============================== */

STATIC void emit_string(YAML::Emitter &out, const char *s, const size_t len) {
    std::string str(s, len);
    if (yamlconv_classify_plain_scalar(str) != YAMLCONV_SCALAR_STRING) out << YAML::DoubleQuoted;
    out << str;
}

STATIC void emit_double(YAML::Emitter &out, const double d) {
    if (std::isnan(d)) {
        out << ".nan";
    } else if (std::isinf(d)) {
        out << (d < 0 ? "-.inf" : ".inf");
    } else {
        char buf[BUF_SIZE_DOUBLE_RAPID_JSON];
        jqrutil_double_to_string_rapidjson(d, buf, sizeof(buf));
        out << buf;
    }
}

STATIC void emit_value(YAML::Emitter &out, const JValue &v) {
    switch (v.GetType()) {
        case rapidjson::kNullType:
            out << YAML::Null;
            break;
        case rapidjson::kFalseType:
            out << false;
            break;
        case rapidjson::kTrueType:
            out << true;
            break;
        case rapidjson::kStringType:
            emit_string(out, v.GetString(), v.GetStringLength());
            break;
        case rapidjson::kNumberType: {
            if (v.IsUint64())
                out << v.GetUint64();
            else if (v.IsInt64())
                out << v.GetInt64();
            else
                emit_double(out, v.GetDouble());
            break;
        }
        case rapidjson::kObjectType: {
            out << YAML::BeginMap;
            for (auto &m : v.GetObject()) {
                out << YAML::Key;
                emit_string(out, m.name.GetString(), m.name.GetStringLength());
                out << YAML::Value;
                emit_value(out, m.value);
            }
            out << YAML::EndMap;
            break;
        }
        case rapidjson::kArrayType: {
            out << YAML::BeginSeq;
            for (auto &e : v.GetArray()) {
                emit_value(out, e);
            }
            out << YAML::EndSeq;
            break;
        }
    }
}

JqrUtilCode yamlconv_emit_value(const JValue &val, std::string &output) {
    output.clear();
    YAML::Emitter out;
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetBoolFormat(YAML::LowerCase);
    emit_value(out, val);
    if (!out.good()) {
        jqr_log(JQR_LOG_VERBOSE, "Failed to emit YAML: %s", out.GetLastError().c_str());
        return JQRUTIL_YAML_EMIT_ERROR;
    }
    output.assign(out.c_str(), out.size());
    return JQRUTIL_SUCCESS;
}
