#ifndef JQR_SELECTOR_H_
#define JQR_SELECTOR_H_

#include "jqr/dom.h"
#include "jqr/rapidjson_includes.h"
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct Token {
    enum TokenType {
        UNKNOWN = 0,
        DOLLAR, DOT, DOTDOT, WILDCARD,
        COLON, COMMA, AT, QUESTION_MARK,
        LBRACKET, RBRACKET, LPAREN, RPAREN,
        SINGLE_QUOTE, DOUBLE_QUOTE,
        PLUS, MINUS, DIV, PCT,
        EQ, NE, GT, LT, GE, LE, NOT, ASSIGN,
        ALPHA, DIGIT, SPACE,
        TRUE, FALSE, AND, OR,
        SPECIAL_CHAR,
        END
    };

    Token()
            : type(Token::UNKNOWN)
            , strVal()
    {}
    TokenType type;
    std::string_view strVal;
};

/**
 * A helper class that contains a string view and an optional internal string. The caller decides if the view
 * is a view of an external string or the internal string.
 * If StringViewHelper::str is empty, the underlying string is owned by an external resource.
 * Otherwise, the underlying string is owned by StringViewHelper.
 */
struct StringViewHelper {
    StringViewHelper() : str(), view() {}
    StringViewHelper(const StringViewHelper &svh) {
        str = svh.str;
        if (str.empty())
            view = svh.view;
        else
            view = std::string_view(str.c_str(), str.length());
    }
    const std::string_view& getView() const { return view; }
    void setInternalString(const std::string &s) {
        str = s;
        view = std::string_view(str.c_str(), str.length());
    }
    void setExternalView(const std::string_view &sv) {
        view = sv;
    }

 private:
    std::string str;
    std::string_view view;
    StringViewHelper& operator=(const StringViewHelper&);  // disable assignment operator
};

class Lexer {
 public:
    Lexer()
            : p(nullptr)
            , next()
            , path(nullptr)
            , rdTokens(0)
    {}
    void init(const char *path);
    Token::TokenType peekToken() const;
    Token nextToken(const bool skipSpace = false);
    const Token& currToken() const { return next; }
    bool matchToken(const Token::TokenType type, const bool skipSpace = false);
    JqrUtilCode scanInteger(int64_t &val);
    JqrUtilCode scanUnquotedMemberName(StringViewHelper &member_name);
    JqrUtilCode scanPathValue(StringViewHelper &output);
    JqrUtilCode scanDoubleQuotedString(JParser& parser);
    JqrUtilCode scanDoubleQuotedString(std::stringstream &ss);
    JqrUtilCode scanSingleQuotedString(std::stringstream &ss);
    JqrUtilCode scanSingleQuotedStringAndConvertToDoubleQuotedString(std::stringstream &ss);
    JqrUtilCode scanNumberInFilterExpr(StringViewHelper &number_sv);
    JqrUtilCode scanIdentifier(StringViewHelper &sv);
    void skipSpaces();
    void unescape(const std::string_view &input, std::stringstream &ss);
    size_t getRecursiveDescentTokens() const { return rdTokens; }
    const char *p;  // current position in path
    Token next;

 private:
    Lexer(const Lexer &t);  // disable copy constructor
    Lexer& operator=(const Lexer &rhs);  // disable assignment constructor
    JqrUtilCode scanUnsignedInteger(int64_t &val);
    const char *path;
    size_t rdTokens;  // number of recursive descent tokens
};

/**
 * One element of a relative path inside a filter, e.g. the ".price" in "@.price < 10" or the "[0]" in
 * "@.tags[0] == 'a'".
 */
struct RelPathElement {
    bool isIndex;
    std::string name;
    int64_t index;
};
typedef std::vector<RelPathElement> RelPath;

struct PathExpression;

/**
 * Compiled filter expression. A tree of OR/AND nodes whose leaves test the current node:
 *   EXISTS:     @<operand> exists
 *   COMPARISON: @<operand> <op> <value>
 *   CONTAINS:   @<operand> is an array with at least one element e such that e <op> <value>
 * The comparison value is either a literal or a "$"-rooted path that is evaluated against the document.
 */
struct FilterExpr {
    enum Type {
        OR,
        AND,
        EXISTS,
        COMPARISON,
        CONTAINS
    };

    FilterExpr();
    FilterExpr(FilterExpr &&other);
    FilterExpr& operator=(FilterExpr &&other);
    ~FilterExpr();

    Type type;
    std::vector<FilterExpr> children;         // OR, AND
    RelPath operand;                          // empty means the current node itself
    Token::TokenType op;                      // COMPARISON, CONTAINS
    JValue literal;                           // comparison value if subPath is null
    std::unique_ptr<PathExpression> subPath;  // "$"-rooted comparison value
};

/**
 * One selector step of a compiled path.
 */
struct PathStep {
    enum Type {
        MEMBER,        // .name or ['name']
        INDEX,         // [i]
        WILDCARD,      // .* or [*]
        MEMBER_UNION,  // ['a','b']
        INDEX_UNION,   // [i,j]
        SLICE,         // [start:end:step]
        FILTER,        // [?(...)]
        RECURSIVE,     // .. applies the remaining steps at every container of the subtree
        LENGTH         // .length()
    };

    explicit PathStep(Type t)
            : type(t)
            , names()
            , indexes()
            , hasStart(false)
            , hasEnd(false)
            , start(0)
            , end(0)
            , step(1)
            , filter()
    {}

    Type type;
    std::vector<std::string> names;   // MEMBER, MEMBER_UNION
    std::vector<int64_t> indexes;     // INDEX, INDEX_UNION
    bool hasStart;                    // SLICE
    bool hasEnd;
    int64_t start;
    int64_t end;
    int64_t step;
    FilterExpr filter;                // FILTER
};

/**
 * A compiled JSONPath query. It does not depend on any document, so it can be evaluated against any number of
 * documents.
 */
struct PathExpression {
    PathExpression() : steps(), hasRecursive(false) {}

    /**
     * A definite path addresses at most one location: it only consists of member names and single indexes,
     * optionally followed by length().
     */
    bool isDefinite() const;

    std::vector<PathStep> steps;
    bool hasRecursive;
};

/**
 * A JSONPath compiler for the v2 path syntax. Compilation validates the whole query string and produces a
 * PathExpression, or fails with a syntax or limit error code.
 *
 * EBNF Grammar of the supported JSONPath:
 *   Query               ::= "$" RelativePath [ ".length()" ]
 *   RelativePath        ::= empty | RecursivePath | DotPath | BracketPath
 *   RecursivePath       ::= ".." ( Key | BracketPathElement ) RelativePath
 *   DotPath             ::= "." QualifiedPath
 *   QualifiedPath       ::= QualifiedPathElement RelativePath
 *   QualifiedPathElement ::= Key | BracketPathElement
 *   Key                 ::= "*" [ [ "." ] WildcardFilter ] | UnquotedMemberName
 *   WildcardFilter      ::=  "[" "?" "(" FilterExpr ")" "]"
 *   BracketPath         ::= BracketPathElement [ RelativePath ]
 *   BracketPathElement  ::= "[" {SPACE} ( WildcardInBrackets | ((NameInBrackets | IndexExpr) ) {SPACE} "]")
 *   WildcardInBrackets  ::= "*" {SPACE} "]" [ "[" {SPACE} "?" "(" FilterExpr ")" {SPACE} "]" ]
 *   NameInBrackets      ::= QuotedMemberName [ ({SPACE} "," {SPACE} QuotedMemberName)+ ]
 *   QuotedMemberName    ::= "\"" {char} "\"" | "'" {char} "'"
 *   IndexExpr           ::= Filter | SliceStartsWithColon | SliceOrUnionOrIndex
 *   SliceStartsWithColon ::= {SPACE} ":" {SPACE} [ ":" {SPACE} [Step] | EndAndStep ] ]
 *   EndAndStep          ::= End [{SPACE} ":" {SPACE} [Step]] ]
 *   SliceOrUnionOrIndex ::= SliceStartsWithInteger | Index | UnionOfIndexes
 *   SliceStartsWithInteger ::= Start {SPACE} ":" {SPACE} [ ":" {SPACE} [Step] | EndAndStep
 *   Index               ::= Integer
 *   Integer             ::= ["+" | "-"] digit {digit}
 *   UnionOfIndexes      ::= Integer ({SPACE} "," {SPACE} Integer)+
 *   Filter              ::= "?" "(" FilterExpr ")"
 *   FilterExpr          ::= {SPACE} Term { {SPACE} "||" {SPACE} Term {SPACE} }
 *   Term                ::= Factor { {SPACE} "&&" {SPACE} Factor }
 *   Factor              ::= ( "@" RelPath [ ComparisonOp ComparisonValue | ArrayContains ] ) |
 *                           ( ComparisonValue ComparisonOp "@" RelPath ) |
 *                           ( {SPACE} "(" FilterExpr ")" {SPACE} )
 *   RelPath             ::= { ("." (UnquotedMemberName | BracketedMemberName)) | BracketedMemberName |
 *                             "[" Integer "]" }
 *   ArrayContains       ::= "[" "?" "(" ( "@" ComparisonOp ComparisonValue | ComparisonValue ComparisonOp "@" )
 *                           ")" "]"
 *   BracketedMemberName ::= "[" {SPACE} QuotedMemberName {SPACE} "]"
 *   ComparisonOp        ::= {SPACE} "<" | "<="] | ">" | ">=" | "==" | "!=" {SPACE}
 *   ComparisonValue     ::= "null" | Bool | Number | QuotedString | PartialPath
 *   PartialPath         ::= "$" RelativePath
 *   SPACE               ::= ' '
 */
class PathCompiler {
 public:
    PathCompiler() : lex() {}

    /**
     * Compile a query string.
     * @param path - NULL terminated query string, which must start with '$'.
     * @param expr - OUTPUT param, the compiled expression. It is reset at the beginning of the call.
     * @return JQRUTIL_SUCCESS for success, a syntax or limit error code otherwise.
     */
    JqrUtilCode compile(const char *path, PathExpression &expr);

 private:
    PathCompiler(const PathCompiler &);
    PathCompiler& operator=(const PathCompiler &);

    JqrUtilCode parseRelativePath(PathExpression &expr);
    JqrUtilCode parseRecursivePath(PathExpression &expr);
    JqrUtilCode parseDotPath(PathExpression &expr);
    JqrUtilCode parseBracketPath(PathExpression &expr);
    JqrUtilCode parseQualifiedPath(PathExpression &expr);
    JqrUtilCode parseQualifiedPathElement(PathExpression &expr);
    JqrUtilCode parseKey(PathExpression &expr);
    JqrUtilCode parseFunctionCall(const std::string_view &name, PathExpression &expr);
    JqrUtilCode parseBracketPathElement(PathExpression &expr);
    JqrUtilCode parseWildcardInBrackets(PathExpression &expr);
    JqrUtilCode parseWildcardFilter(PathExpression &expr);
    JqrUtilCode parseNameInBrackets(PathExpression &expr);
    JqrUtilCode parseQuotedMemberName(std::stringstream &ss);
    JqrUtilCode parseUnquotedMemberName(StringViewHelper &name);
    JqrUtilCode parseIndexExpr(PathExpression &expr);
    JqrUtilCode parseSliceStartsWithColon(PathExpression &expr);
    JqrUtilCode parseSliceOrUnionOrIndex(PathExpression &expr);
    JqrUtilCode parseSliceStartsWithInteger(PathStep &slice, PathExpression &expr);
    JqrUtilCode parseEndAndStep(PathStep &slice, PathExpression &expr);
    JqrUtilCode parseStep(PathStep &slice, PathExpression &expr);
    JqrUtilCode processSlice(PathStep &slice, PathExpression &expr);
    JqrUtilCode processSubscript(const int64_t idx, PathExpression &expr);
    JqrUtilCode parseUnionOfIndexes(const int64_t start, PathExpression &expr);
    JqrUtilCode parseIndex(int64_t &val);
    JqrUtilCode parseFilter(PathExpression &expr);
    JqrUtilCode parseFilterExpr(FilterExpr &filter);
    JqrUtilCode parseTerm(FilterExpr &filter);
    JqrUtilCode parseFactor(FilterExpr &filter);
    JqrUtilCode parseRelPath(RelPath &rel_path);
    JqrUtilCode parseMemberName(StringViewHelper &name);
    JqrUtilCode parseBracketedMemberName(StringViewHelper &member_name);
    JqrUtilCode parseArrayContains(FilterExpr &filter);
    JqrUtilCode parseComparisonValue(FilterExpr &filter);
    JqrUtilCode parseComparisonOp(Token::TokenType &op);
    JqrUtilCode swapComparisonOpSide(Token::TokenType &op);

    Lexer lex;
};

/**
 * The evaluator of a compiled JSONPath. It is named Selector because evaluation means selecting a list of values
 * that match the query.
 *
 *    PathExpression expr;
 *    JqrUtilCode rc = PathCompiler().compile(path, expr);
 *    Selector selector;
 *    selector.getValues(doc, expr);
 *
 * The outcome is a result set (selector.getResultSet()) in document traversal order. Each entry is a ValueInfo
 * with the selected value, its path in json pointer format, and the origin of the value:
 *   DOCUMENT:   the value lives in the document.
 *   COMPUTED:   the value was produced by the evaluator (length()) and lives in the selector. Use
 *               getComputedValue() to access it.
 *   UNRESOLVED: a definite path whose location does not exist. Only the path is set.
 *
 * Evaluation never fails. Locations that cannot be resolved simply produce no value.
 */
class Selector {
 public:
    Selector()
            : root(nullptr)
            , expr(nullptr)
            , resultSet()
            , computedValues()
            , subPathValues()
    {}

    enum Origin {
        DOCUMENT,
        COMPUTED,
        UNRESOLVED
    };

    struct ValueInfo {
        const JValue *value;  // DOCUMENT only
        std::string path;     // json pointer
        Origin origin;
        size_t computedIndex;  // COMPUTED only
    };

    /**
     * Entry point for READ query. The document and the expression must outlive the result set.
     */
    void getValues(const JValue &root, const PathExpression &expr);

    const std::vector<ValueInfo>& getResultSet() const { return resultSet; }
    JValue& getComputedValue(const size_t idx) { return computedValues[idx]; }

 private:
    Selector(const Selector &);
    Selector& operator=(const Selector &);

    void evalStep(const JValue &v, std::string &path, const size_t idx);
    void evalChild(const JValue &child, std::string &path, const char *token, const size_t len, const size_t idx);
    void evalArrayIndex(const JValue &v, std::string &path, int64_t i, const size_t idx);
    void processSlice(const JValue &v, std::string &path, const PathStep &step, const size_t idx);
    void processLength(const JValue &v, const std::string &path);
    void recursiveSearch(const JValue &v, std::string &path, const size_t idx);
    bool evalFilterExpr(const FilterExpr &filter, const JValue &v);
    const JValue *resolveRelPath(const JValue &v, const RelPath &rel_path) const;
    const JValue *getComparisonValue(const FilterExpr &filter);
    bool evalOp(const JValue *v, const Token::TokenType op, const JValue &comparison_value) const;
    void addUnresolvedPath();
    void dedupe();

    const JValue *root;
    const PathExpression *expr;
    std::vector<ValueInfo> resultSet;
    std::vector<JValue> computedValues;
    // "$"-rooted comparison values, resolved at most once per evaluation. nullptr means the path did not
    // resolve to exactly one scalar.
    std::unordered_map<const FilterExpr*, std::unique_ptr<JValue>> subPathValues;
};

#endif  // JQR_SELECTOR_H_
