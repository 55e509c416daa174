/**
 * The NORMALIZE module folds the outcome of a query into one JSON value.
 *
 *   compile failed      -> INVALID_QUERY, flattened to the string "Invalid JSONPath query"
 *   zero matches        -> EMPTY, flattened to the string "No results found"
 *   exactly one match   -> VALUE, the resolved match itself (not wrapped, even if it is an array)
 *   more than one match -> VALUE, an array of the resolved matches in sequence order
 *
 * Resolution copies every borrowed value, so the result never aliases the document.
 *
 * Every public interface method declared in this file is prefixed with "normalize_" or "query_result_".
 */
#ifndef JQR_NORMALIZE_H_
#define JQR_NORMALIZE_H_

#include "jqr/dom.h"
#include "jqr/match.h"
#include "jqr/util.h"

#define JQR_NO_RESULTS_FOUND "No results found"
#define JQR_INVALID_JSONPATH_QUERY "Invalid JSONPath query"

struct QueryResult {
    enum Status {
        VALUE,
        EMPTY,
        INVALID_QUERY
    };

    QueryResult() : status(EMPTY), value() {}

    Status status;
    JValue value;  // VALUE only
};

/* Fold a match sequence. The matches are consumed: synthesized values are moved into the result. */
void normalize_matches(MatchSequence &matches, QueryResult &result);

/* Fold a match sequence into an array, whatever the cardinality. An empty sequence gives an empty array. */
void normalize_matches_as_array(MatchSequence &matches, JValue &result);

/* The outcome of a query that failed to compile. */
void normalize_compile_failure(QueryResult &result);

/**
 * Fold the outcome of a query.
 * @param rc - result of compiling the query. Any code other than JQRUTIL_SUCCESS means the compile failed.
 * @param matches - the evaluated matches, ignored if the compile failed. May be null only in that case.
 */
void normalize_query(const JqrUtilCode rc, MatchSequence *matches, QueryResult &result);

/**
 * Turn a result into the JSON value printed for it: the value itself or one of the two sentinel strings.
 * The result is consumed: its value is moved to out.
 */
void query_result_flatten(QueryResult &result, JValue &out);

#endif  // JQR_NORMALIZE_H_
