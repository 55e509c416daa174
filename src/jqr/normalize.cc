#include "jqr/normalize.h"
#include "jqr/stats.h"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

STATIC void append_resolved(MatchSequence &matches, JValue &arr) {
    arr.SetArray();
    arr.Reserve(static_cast<rapidjson::SizeType>(matches.size()), allocator);
    for (auto &m : matches) {
        JValue v;
        m.resolve(v);
        arr.PushBack(v, allocator);
    }
}

void normalize_matches(MatchSequence &matches, QueryResult &result) {
    result.status = QueryResult::EMPTY;
    result.value.SetNull();

    if (matches.empty()) {
        jqrstats_update_stats_on_query(JQRSTATS_EMPTY);
        return;
    }
    result.status = QueryResult::VALUE;
    if (matches.size() == 1) {
        matches[0].resolve(result.value);
        jqrstats_update_stats_on_query(JQRSTATS_SINGULAR);
    } else {
        append_resolved(matches, result.value);
        jqrstats_update_stats_on_query(JQRSTATS_PLURAL);
    }
}

void normalize_matches_as_array(MatchSequence &matches, JValue &result) {
    append_resolved(matches, result);
    jqrstats_update_stats_on_query(matches.empty() ? JQRSTATS_EMPTY :
                                   (matches.size() == 1 ? JQRSTATS_SINGULAR : JQRSTATS_PLURAL));
}

void normalize_compile_failure(QueryResult &result) {
    result.status = QueryResult::INVALID_QUERY;
    result.value.SetNull();
    jqrstats_update_stats_on_query(JQRSTATS_INVALID);
}

void normalize_query(const JqrUtilCode rc, MatchSequence *matches, QueryResult &result) {
    if (rc != JQRUTIL_SUCCESS || matches == nullptr) {
        normalize_compile_failure(result);
        return;
    }
    normalize_matches(*matches, result);
}

void query_result_flatten(QueryResult &result, JValue &out) {
    switch (result.status) {
        case QueryResult::VALUE:
            out = result.value;
            break;
        case QueryResult::EMPTY:
            out.SetString(rapidjson::StringRef(JQR_NO_RESULTS_FOUND));
            break;
        case QueryResult::INVALID_QUERY:
            out.SetString(rapidjson::StringRef(JQR_INVALID_JSONPATH_QUERY));
            break;
    }
}
