#include "jqr/match.h"

Match Match::borrowed(const JValue &v, const std::string &path) {
    Match m;
    m.kind = BORROWED;
    m.ref = &v;
    m.path = path;
    return m;
}

Match Match::synthesized(JValue &v, const std::string &path) {
    Match m;
    m.kind = SYNTHESIZED;
    m.owned = v;
    m.path = path;
    return m;
}

Match Match::absent(const std::string &path) {
    Match m;
    m.kind = ABSENT;
    m.path = path;
    return m;
}

void Match::resolve(JValue &out) {
    out.SetNull();
    switch (kind) {
        case BORROWED:
            dom_copy_value(*ref, out);
            break;
        case SYNTHESIZED:
            out = owned;
            break;
        case ABSENT:
            break;
    }
}

void jqr_select(const JValue &root, const PathExpression &expr, MatchSequence &matches) {
    matches.clear();
    Selector selector;
    selector.getValues(root, expr);

    const std::vector<Selector::ValueInfo> &rs = selector.getResultSet();
    matches.reserve(rs.size());
    for (auto &vInfo : rs) {
        switch (vInfo.origin) {
            case Selector::DOCUMENT:
                matches.push_back(Match::borrowed(*vInfo.value, vInfo.path));
                break;
            case Selector::COMPUTED:
                matches.push_back(Match::synthesized(selector.getComputedValue(vInfo.computedIndex), vInfo.path));
                break;
            case Selector::UNRESOLVED:
                matches.push_back(Match::absent(vInfo.path));
                break;
        }
    }
}
