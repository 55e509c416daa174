/**
 * DOM (Document Object Model) layer on top of RapidJSON:
 * 1. Parsing an input buffer into a document, with the nesting depth bounded by the max-path-limit config
 * 2. Serializing a value as compact or indented JSON text
 * 3. Deep copying values, which is how query results are detached from the document
 *
 * Design Considerations:
 * 1. Memory management: every byte held by a JSON value comes from dom_alloc, dom_free and dom_realloc.
 *    RapidJSON is pointed at them by the RapidJsonAllocator template argument below, so the stats module sees
 *    parse and query footprints and unit tests can check for leaks.
 * 2. A method that hands a heap-allocated object to the caller documents who frees it.
 *
 * Coding Conventions & Best Practices:
 * 1. Error handling: If a method may fail, the return type should be enum JqrUtilCode.
 * 2. Output parameters: Output parameters should be placed at the end. Output parameters should be initialized at the
 *    beginning of the method. It should not require the caller to do any initialization before invoking the method.
 * 3. Every public interface method declared in this file should be prefixed with "dom_".
 */
#ifndef JQR_DOM_H_
#define JQR_DOM_H_

#include <stdlib.h>
#include <string>
#include <string_view>
#include "jqr/util.h"
#include "jqr/alloc.h"
#include "jqr/rapidjson_includes.h"

/**
 * RapidJSON allocator policy. Every node and string of a parsed document or a query result is allocated
 * through dom_alloc, so the stats module sees it. Passed to GenericValue and GenericDocument as a template
 * argument.
 */
class RapidJsonAllocator {
 public:
    void *Malloc(size_t size) {
        return size == 0 ? nullptr : dom_alloc(size);
    }
    void *Realloc(void *originalPtr, size_t /*originalSize*/, size_t newSize) {
        return dom_realloc(originalPtr, newSize);
    }
    static void Free(void *ptr) RAPIDJSON_NOEXCEPT { dom_free(ptr); }
    bool operator==(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT { return true; }
    bool operator!=(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT { return false; }
    static const bool kNeedFree = true;
};

/**
 * Value types.
 *
 *  JValue     One node of a JSON tree, root or not. Move-only: operator= moves, CopyFrom (or dom_copy_value)
 *             deep copies. Functions that allocate take the global "allocator".
 *
 *  JParser    Parses text into the JValue it holds. Lives on the stack for the duration of a parse, then its
 *             value is moved into a JDocument.
 *
 *  JDocument  A parsed input document: the root JValue plus the memory size of the whole tree. Queries borrow
 *             from it and never change it.
 */
typedef rapidjson::GenericValue<rapidjson::UTF8<>, RapidJsonAllocator> RJValue;
typedef RJValue JValue;
typedef rapidjson::GenericDocument<rapidjson::UTF8<>, RapidJsonAllocator> RJParser;

extern RapidJsonAllocator allocator;

struct JDocument : JValue {
    JDocument() : JValue(), size(0) {}
    JValue& GetJValue() { return *this; }
    const JValue& GetJValue() const { return *this; }
    void SetJValue(JValue& rhs) { *static_cast<JValue *>(this) = rhs; }  // moves rhs in
    size_t size;
    void *operator new(size_t size) { return dom_alloc(size); }
    void operator delete(void *ptr) { dom_free(ptr); }

 private:
    void *operator new[](size_t);       // not defined, documents are never allocated in arrays
    void operator delete[](void *);
};

struct JParser : RJParser {
    JParser() : RJParser(&allocator), allocated_size(0) {}

    using RJParser::HasParseError;
    using RJParser::GetErrorOffset;
    JValue& GetJValue() { return *this; }

    JqrUtilCode GetParseErrorCode() const {
        switch (GetParseError()) {
            case rapidjson::kParseErrorNone:
                return JQRUTIL_SUCCESS;
            case rapidjson::kParseErrorTermination:
                return JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED;
            default:
                return JQRUTIL_JSON_PARSE_ERROR;
        }
    }

    /* Parse with full precision numbers, recording the bytes allocated for the tree. */
    JParser& Parse(const char *json, size_t len);

    /* Bytes held by the parsed tree, its root node included. */
    size_t GetJValueSize() const { return allocated_size + sizeof(RJValue); }

 private:
    size_t allocated_size;
};

/* Parse input JSON string, validate syntax, and return a document object.
 * This method can handle an input string that is not NULL terminated.
 * Numbers are parsed with full precision. Nesting deeper than the max-path-limit config is rejected
 * with JQRUTIL_DOCUMENT_PATH_LIMIT_EXCEEDED.
 *
 * @param json_buf - pointer to string buffer, which may not be NULL terminated.
 * @param buf_len - length of the input string buffer.
 * @param doc - OUTPUT param, pointer to document pointer. The caller is responsible for calling
 *        dom_free_doc(JDocument*) to free the memory after it's consumed.
 * @param err_msg - OUTPUT param, optional. On failure it receives a human readable message that includes
 *        the byte offset of the error, e.g. "Invalid JSON: Invalid value. (at offset 0)".
 * @return JQRUTIL_SUCCESS for success, other code for failure.
 */
JqrUtilCode dom_parse(const char *json_buf, const size_t buf_len, JDocument **doc, std::string *err_msg = nullptr);

/* Free a document object */
void dom_free_doc(JDocument *doc);

/* Get document size */
size_t dom_get_doc_size(const JDocument *doc);

/* Set document size */
void dom_set_doc_size(JDocument *doc, const size_t size);

/**
  * Serialize a value into the given string buffer.
  * @param format - controls format of returned JSON string.
  *        if NULL, return JSON in compact format (no space, no indent, no newline).
  * @param oss - output buffer, the JSON text is appended to it.
  * @return JQRUTIL_SERIALIZATION_ERROR if the value holds a number JSON cannot represent (NaN, Infinity).
  */
JqrUtilCode dom_serialize_value(const JValue &val, const PrintFormat *format, rapidjson::StringBuffer &oss);

/* Deep copy a value. dest receives an independent tree allocated by the JSON allocator. */
void dom_copy_value(const JValue &src, JValue &dest);

/* Maximum nesting depth of a value. A scalar has depth 0. */
size_t dom_path_depth(const JValue &val);

/* View of a string value's bytes. The value must be a string. */
inline std::string_view dom_get_string_view(const JValue &val) {
    return std::string_view(val.GetString(), val.GetStringLength());
}

#endif  // JQR_DOM_H_
