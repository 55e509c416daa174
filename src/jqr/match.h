/**
 * The MATCH module presents the outcome of a query evaluation as an ordered sequence of matches, each tagged with
 * its provenance:
 *   BORROWED:    a reference to a value that lives in the document. Nothing is copied until the match is resolved.
 *   SYNTHESIZED: a value computed by the evaluator, e.g. the result of length(). The match owns it.
 *   ABSENT:      a definite path location that holds no value.
 *
 * Every match carries its location as a json pointer, e.g. "/store/book/0/title".
 *
 * Coding Conventions & Best Practices:
 * 1. A MatchSequence is never null. An empty sequence means the query selected nothing.
 * 2. Resolving a match never modifies the document.
 */
#ifndef JQR_MATCH_H_
#define JQR_MATCH_H_

#include <string>
#include <vector>
#include "jqr/dom.h"
#include "jqr/selector.h"

struct Match {
    enum Kind {
        BORROWED,
        SYNTHESIZED,
        ABSENT
    };

    Match() : kind(ABSENT), ref(nullptr), owned(), path() {}
    Match(Match &&other) = default;
    Match& operator=(Match &&other) = default;

    static Match borrowed(const JValue &v, const std::string &path);
    static Match synthesized(JValue &v, const std::string &path);  // v is moved into the match
    static Match absent(const std::string &path);

    /**
     * Produce the concrete JSON value of this match.
     * BORROWED is deep copied, SYNTHESIZED is moved out, ABSENT becomes null.
     * @param out - OUTPUT param, receives an independently owned value.
     */
    void resolve(JValue &out);

    Kind kind;
    const JValue *ref;   // BORROWED only
    JValue owned;        // SYNTHESIZED only
    std::string path;

 private:
    Match(const Match &);
    Match& operator=(const Match &);
};

typedef std::vector<Match> MatchSequence;

/**
 * Evaluate a compiled expression against a document.
 * Deterministic, never modifies the document, never fails.
 * @param matches - OUTPUT param, cleared first, then filled in document traversal order.
 */
void jqr_select(const JValue &root, const PathExpression &expr, MatchSequence &matches);

#endif  // JQR_MATCH_H_
