#include "jqr/dom.h"
#include "jqr/jqr.h"
#include "jqr/stats.h"
#include <algorithm>
#include <cstring>
#include <string>
#include <unordered_map>
#include "jqr/rapidjson_includes.h"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

// the one true allocator
RapidJsonAllocator allocator;

JParser& JParser::Parse(const char *json, size_t len) {
    int64_t begin_val = jqrstats_begin_track_mem();
    RJParser::Parse<rapidjson::kParseFullPrecisionFlag | rapidjson::kParseValidateEncodingFlag>(json, len);
    int64_t delta = jqrstats_end_track_mem(begin_val);
    allocated_size = delta > 0 ? static_cast<size_t>(delta) : 0;
    return *this;
}

/**
 * SAX handler that only tracks the nesting depth. Returning false from a handler makes the reader stop with
 * kParseErrorTermination, which is how the document path limit is enforced before any value is built.
 */
struct DepthLimitHandler : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, DepthLimitHandler> {
    explicit DepthLimitHandler(size_t _limit) : limit(_limit), depth(0), max_depth(0) {}

    bool StartObject() { return push(); }
    bool EndObject(rapidjson::SizeType) { depth--; return true; }
    bool StartArray() { return push(); }
    bool EndArray(rapidjson::SizeType) { depth--; return true; }

    size_t limit;
    size_t depth;
    size_t max_depth;

 private:
    bool push() {
        depth++;
        max_depth = std::max(max_depth, depth);
        return depth <= limit;
    }
};

STATIC void format_parse_error(rapidjson::ParseErrorCode code, size_t offset, std::string *err_msg) {
    if (err_msg == nullptr) return;
    *err_msg = "Invalid JSON: ";
    if (code == rapidjson::kParseErrorTermination) {
        err_msg->append(jqrutil_code_to_message(JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED));
    } else {
        err_msg->append(rapidjson::GetParseError_En(code));
    }
    err_msg->append(" (at offset ");
    err_msg->append(std::to_string(offset));
    err_msg->append(")");
}

/**
 * A member name given more than once keeps the position of its first occurrence and the value of its last one.
 */
STATIC void merge_duplicate_members(JValue &v) {
    if (v.IsObject()) {
        if (v.MemberCount() > 1) {
            std::unordered_map<std::string, rapidjson::SizeType> seen;
            rapidjson::SizeType i = 0;
            while (i < v.MemberCount()) {
                JValue::MemberIterator it = v.MemberBegin() + i;
                auto res = seen.emplace(std::string(it->name.GetString(), it->name.GetStringLength()), i);
                if (res.second) {
                    i++;
                } else {
                    (v.MemberBegin() + res.first->second)->value = it->value;
                    v.EraseMember(it);
                }
            }
        }
        for (auto &m : v.GetObject()) merge_duplicate_members(m.value);
    } else if (v.IsArray()) {
        for (auto &e : v.GetArray()) merge_duplicate_members(e);
    }
}

STATIC JDocument *create_doc() {
    return new JDocument();
}

void dom_free_doc(JDocument *doc) {
    delete doc;
}

size_t dom_get_doc_size(const JDocument *doc) {
    return doc->size;
}

void dom_set_doc_size(JDocument *doc, const size_t size) {
    doc->size = size;
}

JqrUtilCode dom_parse(const char *json_buf, const size_t buf_len, JDocument **doc, std::string *err_msg) {
    *doc = nullptr;
    if (err_msg != nullptr) err_msg->clear();

    // Pass 1: syntax and nesting depth, without building values. The iterative parser keeps the
    // C++ stack flat no matter how deep the input is.
    DepthLimitHandler depth_handler(jqr_get_max_path_limit());
    {
        rapidjson::MemoryStream ms(json_buf, buf_len);
        rapidjson::EncodedInputStream<rapidjson::UTF8<>, rapidjson::MemoryStream> is(ms);
        rapidjson::Reader reader;
        constexpr unsigned parse_flags = rapidjson::kParseIterativeFlag | rapidjson::kParseFullPrecisionFlag |
                                         rapidjson::kParseValidateEncodingFlag;
        if (!reader.Parse<parse_flags>(is, depth_handler)) {
            rapidjson::ParseErrorCode code = reader.GetParseErrorCode();
            format_parse_error(code, reader.GetErrorOffset(), err_msg);
            if (code == rapidjson::kParseErrorTermination) {
                jqr_log(JQR_LOG_VERBOSE, "Document path limit is exceeded. The input has more than %zu nesting"
                        " levels.", depth_handler.limit);
                return JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED;
            }
            return JQRUTIL_JSON_PARSE_ERROR;
        }
    }

    // Pass 2: build the tree
    JParser parser;
    if (parser.Parse(json_buf, buf_len).HasParseError()) {
        format_parse_error(parser.GetParseError(), parser.GetErrorOffset(), err_msg);
        return parser.GetParseErrorCode();
    }
    merge_duplicate_members(parser.GetJValue());
    *doc = create_doc();
    (*doc)->SetJValue(parser.GetJValue());
    dom_set_doc_size(*doc, parser.GetJValueSize());
    jqrstats_update_stats_on_parse(buf_len, depth_handler.max_depth);
    return JQRUTIL_SUCCESS;
}

/**
 * Serialize a value.
 * @param oss OUTPUT param, serialized string is appended to the buffer.
 */
JqrUtilCode dom_serialize_value(const JValue &val, const PrintFormat *format, rapidjson::StringBuffer &oss) {
    bool ok;
    if (format != nullptr) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(oss);
        writer.SetIndent(format->indent_char, format->indent_count);
        ok = val.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(oss);
        ok = val.Accept(writer);
    }
    if (!ok) {
        jqr_log(JQR_LOG_VERBOSE, "%s", jqrutil_code_to_message(JQRUTIL_SERIALIZATION_ERROR));
        return JQRUTIL_SERIALIZATION_ERROR;
    }
    return JQRUTIL_SUCCESS;
}

void dom_copy_value(const JValue &src, JValue &dest) {
    dest.CopyFrom(src, allocator);
}

STATIC void find_path_depth_internal(const JValue& v, size_t d, size_t *max_depth) {
    *max_depth = std::max(d, *max_depth);
    if (v.IsObject()) {
        for (auto &m : v.GetObject())
            find_path_depth_internal(m.value, d+1, max_depth);
    } else if (v.IsArray()) {
        for (auto &m : v.GetArray())
            find_path_depth_internal(m, d+1, max_depth);
    }
}

size_t dom_path_depth(const JValue &val) {
    size_t depth = 0;
    find_path_depth_internal(val, 0, &depth);
    return depth;
}
