#include "jqr/selector.h"
#include "jqr/util.h"
#include "jqr/jqr.h"
#include "jqr/rapidjson_includes.h"
#include <iostream>
#include <cstring>
#include <cctype>
#include <cmath>
#include <algorithm>
#include <unordered_set>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

#ifdef INSTRUMENT_V2PATH
#define TRACE(level, msg) \
std::cout << level << " " << msg << std::endl;
#else
#define TRACE(level, msg)
#endif

static const char DOUBLE_QUOTE = '"';
static const char SINGLE_QUOTE = '\'';

thread_local int64_t current_depth = 0;  // parser's recursion depth

class RecursionDepthTracker {
 public:
    RecursionDepthTracker() {
        current_depth++;
    }
    ~RecursionDepthTracker() {
        current_depth--;
    }
    bool isTooDeep() { return current_depth > static_cast<int64_t>(jqr_get_max_parser_recursion_depth()); }
};

#define CHECK_RECURSION_DEPTH() \
    RecursionDepthTracker _rdtracker; \
    if (_rdtracker.isTooDeep()) return JQRUTIL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED;

#define CHECK_RECURSIVE_DESCENT_TOKENS() \
    if (lex.getRecursiveDescentTokens() > jqr_get_max_recursive_descent_tokens()) \
        return JQRUTIL_RECURSIVE_DESCENT_TOKEN_LIMIT_EXCEEDED;

#define CHECK_QUERY_STRING_SIZE(path) \
    if (strlen(path) > jqr_get_max_query_string_size()) return JQRUTIL_QUERY_STRING_SIZE_LIMIT_EXCEEDED;

void Lexer::init(const char *path) {
    p = path;
    this->path = path;
    next.type = Token::UNKNOWN;
    next.strVal = std::string_view(path, 0);
    rdTokens = 0;
}

/**
 * Operators that may take two characters. "single" is the token when the second character does not follow.
 */
typedef struct {
    char first;
    char second;
    Token::TokenType pair;
    Token::TokenType single;
} OperatorChars;

static const OperatorChars operator_chars[] = {
    {'.', '.', Token::DOTDOT, Token::DOT},
    {'&', '&', Token::AND, Token::SPECIAL_CHAR},
    {'|', '|', Token::OR, Token::SPECIAL_CHAR},
    {'=', '=', Token::EQ, Token::ASSIGN},
    {'!', '=', Token::NE, Token::NOT},
    {'>', '=', Token::GE, Token::GT},
    {'<', '=', Token::LE, Token::LT},
};

STATIC bool isTwoCharToken(const Token::TokenType type) {
    for (auto &op : operator_chars) {
        if (op.pair == type) return true;
    }
    return false;
}

Token::TokenType Lexer::peekToken() const {
    for (auto &op : operator_chars) {
        if (*p == op.first) return *(p+1) == op.second ? op.pair : op.single;
    }
    switch (*p) {
        case '\0': return Token::END;
        case '$': return Token::DOLLAR;
        case '*': return Token::WILDCARD;
        case ':': return Token::COLON;
        case ',': return Token::COMMA;
        case '?': return Token::QUESTION_MARK;
        case '@': return Token::AT;
        case '[': return Token::LBRACKET;
        case ']': return Token::RBRACKET;
        case '(': return Token::LPAREN;
        case ')': return Token::RPAREN;
        case '\'': return Token::SINGLE_QUOTE;
        case '"': return Token::DOUBLE_QUOTE;
        case '+': return Token::PLUS;
        case '-': return Token::MINUS;
        case '/': return Token::DIV;
        case '%': return Token::PCT;
        case ' ': return Token::SPACE;
        default: break;
    }
    unsigned char c = static_cast<unsigned char>(*p);
    if (std::isdigit(c)) return Token::DIGIT;
    if (std::isalpha(c)) return Token::ALPHA;
    TRACE("DEBUG", "peekToken special char: " << *p)
    return Token::SPECIAL_CHAR;
}

/**
 * Scan the next token.
 * @param skipSpace - if the next token is a run of spaces, skip it and scan the token after it.
 * @return next token
 */
Token Lexer::nextToken(const bool skipSpace) {
    next.type = peekToken();
    if (next.type == Token::END) {
        next.strVal = std::string_view(p, 0);
        return next;
    }
    if (next.type == Token::SPACE && skipSpace) {
        while (*p == ' ') p++;
        return nextToken();
    }
    if (next.type == Token::DOTDOT) rdTokens++;
    size_t width = isTwoCharToken(next.type) ? 2 : 1;
    next.strVal = std::string_view(p, width);
    p += width;
    return next;
}

/**
 * If current token matches the given token type, advance to the next token and return true.
 * Otherwise, return false.
 */
bool Lexer::matchToken(const Token::TokenType type, const bool skipSpace) {
    if (skipSpace && next.type == Token::SPACE) {
        while (*p == ' ') p++;
        nextToken();
        return matchToken(type);
    }

    if (next.type == type) {
        nextToken(skipSpace);
        return true;
    }
    return false;
}

/**
 * Scan an integer. An integer is made of the following characters: [0-9]+-.
 */
JqrUtilCode Lexer::scanInteger(int64_t &val) {
    val = 0;
    if (next.type != Token::DIGIT && next.type != Token::PLUS && next.type != Token::MINUS)
        return JQRUTIL_VALUE_NOT_NUMBER;

    if (next.type == Token::DIGIT) {
        JqrUtilCode rc = scanUnsignedInteger(val);
        if (rc != JQRUTIL_SUCCESS) return rc;
    } else {
        int sign = (next.type == Token::PLUS? 1 : -1);
        nextToken();  // skip the PLUS/MINUS sign symbol
        if (next.type != Token::DIGIT) return JQRUTIL_VALUE_NOT_NUMBER;
        JqrUtilCode rc = scanUnsignedInteger(val);
        if (rc != JQRUTIL_SUCCESS) return rc;
        val = sign * val;
    }
    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

JqrUtilCode Lexer::scanUnsignedInteger(int64_t &val) {
    val = *next.strVal.data() - '0';
    while (*p != '\0' && std::isdigit(static_cast<unsigned char>(*p))) {
        int64_t digit = *p - '0';
        if (val > (INT64_MAX - digit) / 10) return JQRUTIL_INVALID_NUMBER;
        val = val * 10 + digit;
        p++;
    }
    TRACE("DEBUG", "scanUnsignedInteger(): " << val)
    return JQRUTIL_SUCCESS;
}

/**
 * Scan unquoted object member name, which can contain any symbol except terminator characters.
 */
JqrUtilCode Lexer::scanUnquotedMemberName(StringViewHelper &member_name) {
    // Check if the first character is a member name terminator char
    static const char *unquotedMemberNameTerminators = ".[]()<>=!'\" |&";
    if (next.type == Token::END) return JQRUTIL_INVALID_MEMBER_NAME;
    const char *p_start = next.strVal.data();
    if (strchr(unquotedMemberNameTerminators, *p_start) != nullptr) {
        TRACE("ERROR", "scanUnquotedMemberName invalid first char of an expected member name: " << p_start)
        return JQRUTIL_INVALID_MEMBER_NAME;
    }
    size_t len = next.strVal.length();

    // Scan the remaining path for the first occurrence of any terminator char
    size_t length = strcspn(p, unquotedMemberNameTerminators);
    len += length;
    p += length;

    member_name.setExternalView(std::string_view(p_start, len));
    TRACE("DEBUG", "scanUnquotedMemberName token type: " << next.type << ", token val: "
        << next.strVal << ", name: " << member_name.getView())
    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Scan number in filter expression. A number is made of the following characters: [0-9]+-.Ee.
 */
JqrUtilCode Lexer::scanNumberInFilterExpr(StringViewHelper &number_sv) {
    // Check if the first character is a valid number character
    static const char *validNumberChars = "+-0123456789.Ee";
    if (next.type == Token::END) return JQRUTIL_INVALID_NUMBER;
    const char *p_start = next.strVal.data();
    if (strchr(validNumberChars, *p_start) == nullptr) {
        TRACE("ERROR", "scanNumberInFilterExpr invalid first char of an expected number: " << p_start)
        return JQRUTIL_INVALID_NUMBER;
    }
    size_t len = 1;

    // Scan the remaining path for the prefix that consists entirely of valid number characters
    size_t length = strspn(p, validNumberChars);
    len += length;
    p += length;

    number_sv.setExternalView(std::string_view(p_start, len));
    TRACE("DEBUG", "scanNumberInFilterExpr number: " << number_sv.getView())
    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Scan an identifier that is an alphanumeric string.
 */
JqrUtilCode Lexer::scanIdentifier(StringViewHelper &sv) {
    // Check if the first character is alphanumeric
    const char *p_start = next.strVal.data();
    if (!std::isalnum(static_cast<unsigned char>(*p_start))) return JQRUTIL_INVALID_IDENTIFIER;
    size_t len = 1;

    // Scan the remaining path for the alphanumeric characters
    while (*p != '\0' && std::isalnum(static_cast<unsigned char>(*p))) {
        p++;
        len++;
    }
    sv.setExternalView(std::string_view(p_start, len));
    TRACE("DEBUG", "scanIdentifier identifier: " << sv.getView())
    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Skip whitespaces including the current token.
 */
void Lexer::skipSpaces() {
    if (next.type == Token::SPACE) {
        nextToken(true);
    } else {
        while (*p == ' ') p++;
    }
}

/**
 * Scan a "$"-rooted path used as a comparison value. The scanned text is compiled separately.
 */
JqrUtilCode Lexer::scanPathValue(StringViewHelper &output) {
    static const char *terminators = "]()<>=!'\" |&";
    static const char *numerics = "-+0123456789";
    static const char *quotes = "\"'";
    char current_quote = '"';
    bool in_brackets = false;
    bool in_quotes = false;
    bool scanning = true;

    const char *p_start = next.strVal.data();  // leading $
    size_t len = 1;

    // We only check for terminators when we are outside of brackets (and unquoted)
    // When we are inside of brackets, we check for numerics (digits or -+) or quoted values
    // We track which type of quote we are using with current_quote
    while (scanning && *p != '\0') {
        if (!in_brackets) {  // can't be in quotes without being in brackets first
            if (*p == '[') {
                in_brackets = true;
                p++;
                len++;
            } else if (strchr(terminators, *p) != nullptr) {
                scanning = false;
            } else {
                p++;
                len++;
            }
        } else {
            if (!in_quotes) {
                if (strchr(quotes, *p) != nullptr) {
                    in_quotes = true;
                    current_quote = *p;
                    p++;
                    len++;
                } else if (strchr(numerics, *p) != nullptr) {
                    p++;
                    len++;
                } else if (*p == ']') {
                    p++;
                    len++;
                    in_brackets = false;
                } else {
                    return JQRUTIL_INVALID_JSON_PATH;
                }
            } else {
                if (*p == '\\' && *(p+1) == current_quote) {
                    p++;
                    len++;
                } else if (*p == current_quote) {
                    in_quotes = false;
                }
                p++;
                len++;
            }
        }
    }
    if (in_brackets) return JQRUTIL_INVALID_JSON_PATH;

    output.setExternalView(std::string_view(p_start, len));

    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Scan double quoted string that may contain escaped characters.
*/
JqrUtilCode Lexer::scanDoubleQuotedString(JParser& parser) {
    const char *p_start = next.strVal.data();
    size_t len = 1;
    TRACE("DEBUG", "scanDoubleQuotedString *p_start: " << *p_start << ", p: " << p)

    bool closed = false;
    bool in_escape = false;
    while (*p != '\0') {
        if (*p == DOUBLE_QUOTE && !in_escape) {
            // reached the end quote
            p++;
            len++;
            closed = true;
            break;
        }
        in_escape = (*p == '\\' && !in_escape);
        p++;
        len++;
    }
    if (!closed) return JQRUTIL_INVALID_JSON_PATH;
    std::string_view name = std::string_view(p_start, len);

    // unescape the content using JParser
    if (parser.Parse(name.data(), name.length()).HasParseError() || !parser.GetJValue().IsString()) {
        TRACE("ERROR", "scanDoubleQuotedString failed to parse " << name)
        return JQRUTIL_INVALID_JSON_PATH;
    }
    TRACE("DEBUG", "scanDoubleQuotedString before unescape: " << name << ", after unescape: "
    << dom_get_string_view(parser.GetJValue()))

    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Scan double quoted string that may contain escaped characters.
*/
JqrUtilCode Lexer::scanDoubleQuotedString(std::stringstream &ss) {
    JParser parser;
    JqrUtilCode rc = scanDoubleQuotedString(parser);
    if (rc != JQRUTIL_SUCCESS) return rc;
    ss << dom_get_string_view(parser.GetJValue());
    return JQRUTIL_SUCCESS;
}

JqrUtilCode Lexer::scanSingleQuotedStringAndConvertToDoubleQuotedString(std::stringstream &ss) {
    const char *p_start = p;
    size_t len = 0;

    bool closed = false;
    bool in_escape = false;
    while (*p != '\0') {
        if (*p == SINGLE_QUOTE && !in_escape) {
            // reached the end quote
            p++;
            closed = true;
            break;
        }
        in_escape = (*p == '\\' && !in_escape);
        p++;
        len++;
    }
    if (!closed) return JQRUTIL_INVALID_JSON_PATH;
    // the string view does not include begin and end single quote
    std::string_view sv = std::string_view(p_start, len);
    ss << "\"";
    for (std::string::size_type i = 0; i < sv.length(); ++i) {
        switch (sv[i]) {
            case '"': {
                ss << "\\\"";
                break;
            }
            case '\\': {  // unescape single quotes
                if (i + 1 < sv.length() && sv[i+1] == '\'') break;
                ss << sv[i];
                break;
            }
            default:
                ss << sv[i];
                break;
        }
    }
    ss << "\"";

    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * Scan single quoted string that may contain escaped characters.
 */
JqrUtilCode Lexer::scanSingleQuotedString(std::stringstream &ss) {
    const char *p_start = p;
    size_t len = 0;

    bool closed = false;
    bool escaped = false;
    bool in_escape = false;
    while (*p != '\0') {
        if (*p == SINGLE_QUOTE && !in_escape) {
            // reached the end quote
            p++;
            closed = true;
            break;
        }
        if (*p == '\\') escaped = true;
        in_escape = (*p == '\\' && !in_escape);
        p++;
        len++;
    }
    if (!closed) return JQRUTIL_INVALID_JSON_PATH;
    // the string view does not include begin and end single quote
    std::string_view name = std::string_view(p_start, len);

    if (escaped) {
        unescape(name, ss);
    } else {
        ss << name;
        TRACE("DEBUG", "scanSingleQuotedString name: " << ss.str())
    }

    nextToken();  // advance to the next token
    return JQRUTIL_SUCCESS;
}

/**
 * A helper function to unescape escaped control characters. It is only used for processing single
 * quoted strings. The string view handed down does not contain begin and end single quote.
 *
 * For double quoted strings, JParser::Parse is used to read escaped characters. See scanDoubleQuotedString.
 *
 * @param input string view excluding begin and end quote
 * @param ss output string stream
 */
void Lexer::unescape(const std::string_view &input, std::stringstream &ss) {
    static const char *ctrlChar_2ndPart = "\\tbfnr'";
    static const char *ctrlChars = "\\\t\b\f\n\r\'";  // internal representation of control characters
    for (std::string::size_type i = 0; i < input.length(); ++i) {
        switch (input[i]) {
            case '\\': {
                if (i == input.length() - 1) {
                    // reached the end of the input
                    ss << input[i];
                } else {
                    // check if the next char is an escaped control character
                    const char *ptr = strchr(ctrlChar_2ndPart, input[i+1]);
                    if (ptr != nullptr && input[i+1] != '\0') {
                        i++;  // skip the backslash, which is used to escape the next character
                        // output the internal representation of the control character
                        ss << ctrlChars[ptr - ctrlChar_2ndPart];
                    } else {
                        // This blackslash does not represent an escaped control character.
                        ss << input[i];
                    }
                }
                break;
            }
            default:
                ss << input[i];
                break;
        }
    }
    TRACE("DEBUG", "unescape before unescape: " << input << ", after unescape: " << ss.str())
}

/* ============================== Compiled expression ============================== */

FilterExpr::FilterExpr()
        : type(EXISTS)
        , children()
        , operand()
        , op(Token::UNKNOWN)
        , literal()
        , subPath()
{}

FilterExpr::FilterExpr(FilterExpr &&other) = default;
FilterExpr& FilterExpr::operator=(FilterExpr &&other) = default;
FilterExpr::~FilterExpr() = default;

bool PathExpression::isDefinite() const {
    for (auto &step : steps) {
        if (step.type != PathStep::MEMBER && step.type != PathStep::INDEX && step.type != PathStep::LENGTH)
            return false;
    }
    return true;
}

/* ============================== PathCompiler ============================== */

JqrUtilCode PathCompiler::compile(const char *path, PathExpression &expr) {
    expr = PathExpression();
    CHECK_QUERY_STRING_SIZE(path);
    lex.init(path);
    lex.nextToken();  // initial pull
    if (!lex.matchToken(Token::DOLLAR)) return JQRUTIL_PATH_MUST_START_WITH_DOLLAR;

    JqrUtilCode rc = parseRelativePath(expr);
    if (rc != JQRUTIL_SUCCESS) {
        TRACE("ERROR", "compile failed, rc: " << rc << ", remaining path: " << lex.p)
        expr = PathExpression();
        return rc;
    }
    TRACE("DEBUG", "compile " << path << " into " << expr.steps.size() << " steps")
    return JQRUTIL_SUCCESS;
}

/**
 *  RelativePath        ::= empty | RecursivePath | DotPath | BracketPath
 */
JqrUtilCode PathCompiler::parseRelativePath(PathExpression &expr) {
    CHECK_RECURSION_DEPTH();
    if (!expr.steps.empty() && expr.steps.back().type == PathStep::LENGTH) {
        // length() must be the last element of the path
        if (lex.currToken().type != Token::END) return JQRUTIL_INVALID_FUNCTION_CALL;
    }

    switch (lex.currToken().type) {
        case Token::END: return JQRUTIL_SUCCESS;
        case Token::DOTDOT: return parseRecursivePath(expr);
        case Token::DOT: return parseDotPath(expr);
        case Token::LBRACKET: return parseBracketPath(expr);
        default:
            TRACE("ERROR", "parseRelativePath unexpected token: " << lex.currToken().type)
            return JQRUTIL_INVALID_JSON_PATH;
    }
}

/**
 *  RecursivePath       ::= ".." ( Key | BracketPathElement ) RelativePath
 */
JqrUtilCode PathCompiler::parseRecursivePath(PathExpression &expr) {
    lex.matchToken(Token::DOTDOT);
    CHECK_RECURSIVE_DESCENT_TOKENS();
    if (lex.currToken().type == Token::DOTDOT || lex.currToken().type == Token::DOT) {
        TRACE("DEBUG", "We have an ambiguous (and therefore invalid) sequence of 3+ dots")
        return JQRUTIL_INVALID_DOT_SEQUENCE;
    }
    if (lex.currToken().type == Token::END) return JQRUTIL_INVALID_JSON_PATH;

    expr.steps.push_back(PathStep(PathStep::RECURSIVE));
    expr.hasRecursive = true;
    return parseQualifiedPath(expr);
}

/**
 *   DotPath             ::= "." QualifiedPath
 */
JqrUtilCode PathCompiler::parseDotPath(PathExpression &expr) {
    lex.matchToken(Token::DOT);
    return parseQualifiedPath(expr);
}

/**
 *   BracketPath         ::= BracketPathElement [ RelativePath ]
 */
JqrUtilCode PathCompiler::parseBracketPath(PathExpression &expr) {
    JqrUtilCode rc = parseBracketPathElement(expr);
    if (rc != JQRUTIL_SUCCESS) return rc;
    return parseRelativePath(expr);
}

/**
 *   QualifiedPath       ::= QualifiedPathElement RelativePath
 */
JqrUtilCode PathCompiler::parseQualifiedPath(PathExpression &expr) {
    TRACE("DEBUG", "parseQualifiedPath curr token: " << lex.currToken().type)
    JqrUtilCode rc = parseQualifiedPathElement(expr);
    if (rc != JQRUTIL_SUCCESS) return rc;
    return parseRelativePath(expr);
}

/**
 *   QualifiedPathElement ::= Key | BracketPathElement
 */
JqrUtilCode PathCompiler::parseQualifiedPathElement(PathExpression &expr) {
    if (lex.currToken().type == Token::LBRACKET)
        return parseBracketPathElement(expr);
    else
        return parseKey(expr);
}

/**
 *   Key                 ::= "*" [ [ "." ] WildcardFilter ] | UnquotedMemberName | "length" "(" ")"
 *   WildcardFilter      ::= "[" "?" "(" FilterExpr ")" "]"
 */
JqrUtilCode PathCompiler::parseKey(PathExpression &expr) {
    if (lex.matchToken(Token::WILDCARD)) {
        if (lex.currToken().type == Token::DOT && lex.peekToken() == Token::LBRACKET) lex.nextToken();  // skip DOT
        if (lex.currToken().type == Token::LBRACKET && lex.peekToken() == Token::QUESTION_MARK) {
            return parseWildcardFilter(expr);
        } else {
            expr.steps.push_back(PathStep(PathStep::WILDCARD));
            return JQRUTIL_SUCCESS;
        }
    } else {
        StringViewHelper name;
        JqrUtilCode rc = parseUnquotedMemberName(name);
        if (rc != JQRUTIL_SUCCESS) return rc;
        if (lex.currToken().type == Token::LPAREN) return parseFunctionCall(name.getView(), expr);

        PathStep step(PathStep::MEMBER);
        step.names.push_back(std::string(name.getView()));
        expr.steps.push_back(std::move(step));
        return JQRUTIL_SUCCESS;
    }
}

/**
 *   FunctionCall        ::= "length" "(" ")"
 */
JqrUtilCode PathCompiler::parseFunctionCall(const std::string_view &name, PathExpression &expr) {
    if (name != "length") return JQRUTIL_INVALID_FUNCTION_CALL;
    if (!lex.matchToken(Token::LPAREN, true)) return JQRUTIL_INVALID_FUNCTION_CALL;
    if (!lex.matchToken(Token::RPAREN)) return JQRUTIL_INVALID_FUNCTION_CALL;
    if (lex.currToken().type != Token::END) return JQRUTIL_INVALID_FUNCTION_CALL;
    expr.steps.push_back(PathStep(PathStep::LENGTH));
    return JQRUTIL_SUCCESS;
}

/**
 *   UnquotedMemberName  ::= char { char }
 */
JqrUtilCode PathCompiler::parseUnquotedMemberName(StringViewHelper &name) {
    JqrUtilCode rc = lex.scanUnquotedMemberName(name);
    if (rc != JQRUTIL_SUCCESS) return rc;
    TRACE("DEBUG", "parseUnquotedMemberName name: " << name.getView())
    return JQRUTIL_SUCCESS;
}

/**
 *   WildcardFilter  ::= "[" "?" "(" FilterExpr ")" "]"
 *
 * A wildcard followed by a filter filters the elements of the current array, i.e., "$.a.*[?(@.x)]" is
 * equivalent to "$.a[?(@.x)]".
 */
JqrUtilCode PathCompiler::parseWildcardFilter(PathExpression &expr) {
    if (!lex.matchToken(Token::LBRACKET)) return JQRUTIL_INVALID_JSON_PATH;
    if (!lex.matchToken(Token::QUESTION_MARK)) return JQRUTIL_INVALID_JSON_PATH;
    if (!lex.matchToken(Token::LPAREN, true)) return JQRUTIL_INVALID_JSON_PATH;

    PathStep step(PathStep::FILTER);
    JqrUtilCode rc = parseFilterExpr(step.filter);
    if (rc != JQRUTIL_SUCCESS) return rc;

    if (!lex.matchToken(Token::RPAREN, true)) return JQRUTIL_INVALID_JSON_PATH;
    if (!lex.matchToken(Token::RBRACKET)) return JQRUTIL_INVALID_JSON_PATH;
    expr.steps.push_back(std::move(step));
    return JQRUTIL_SUCCESS;
}

/**
 *   BracketPathElement  ::= "[" {SPACE} ( WildcardInBrackets | ((NameInBrackets | IndexExpr) ) {SPACE} "]")
 *   WildcardInBrackets  ::= "*" {SPACE} "]" [ "[" {SPACE} "?" "(" FilterExpr ")" {SPACE} "]" ]
 *   NameInBrackets      ::= QuotedMemberName [ ({SPACE} "," {SPACE} QuotedMemberName)+ ]
 *   QuotedMemberName    ::= """ {char} """ | "'" {char} "'"
 *   IndexExpr           ::= Filter | SliceStartsWithColon | SliceOrUnionOrIndex
 */
JqrUtilCode PathCompiler::parseBracketPathElement(PathExpression &expr) {
    if (!lex.matchToken(Token::LBRACKET, true)) {
        TRACE("ERROR", "parseBracketPathElement token [ is not seen")
        return JQRUTIL_INVALID_JSON_PATH;
    }

    JqrUtilCode rc;
    const Token &token = lex.currToken();
    if (token.type == Token::WILDCARD) {
        rc = parseWildcardInBrackets(expr);
    } else {
        if (token.type == Token::SINGLE_QUOTE || token.type == Token::DOUBLE_QUOTE) {
            rc = parseNameInBrackets(expr);
        } else {
            rc = parseIndexExpr(expr);
        }
    }
    if (rc != JQRUTIL_SUCCESS) {
        TRACE("ERROR", "parseBracketPathElement rc: " << rc)
        return rc;
    }
    lex.skipSpaces();
    return JQRUTIL_SUCCESS;
}

/**
 *   WildcardInBrackets  ::= "*" {SPACE} "]" [ "[" {SPACE} "?" "(" FilterExpr ")" {SPACE} "]" ]
 */
JqrUtilCode PathCompiler::parseWildcardInBrackets(PathExpression &expr) {
    if (!lex.matchToken(Token::WILDCARD, true)) return JQRUTIL_INVALID_JSON_PATH;
    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;

    if (lex.currToken().type == Token::LBRACKET && lex.peekToken() == Token::QUESTION_MARK) {
        if (!lex.matchToken(Token::LBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
        lex.skipSpaces();
        if (!lex.matchToken(Token::QUESTION_MARK)) return JQRUTIL_INVALID_JSON_PATH;
        if (!lex.matchToken(Token::LPAREN)) return JQRUTIL_INVALID_JSON_PATH;

        PathStep step(PathStep::FILTER);
        JqrUtilCode rc = parseFilterExpr(step.filter);
        if (rc != JQRUTIL_SUCCESS) return rc;

        if (!lex.matchToken(Token::RPAREN, true)) return JQRUTIL_INVALID_JSON_PATH;
        if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
        expr.steps.push_back(std::move(step));
    } else {
        expr.steps.push_back(PathStep(PathStep::WILDCARD));
    }
    return JQRUTIL_SUCCESS;
}

/**
 *   NameInBrackets      ::= QuotedMemberName { {SPACE} "," {SPACE} QuotedMemberName }
 *   QuotedMemberName    ::= """ {char} """ | "'" {char} "'"
 */
JqrUtilCode PathCompiler::parseNameInBrackets(PathExpression &expr) {
    std::vector<std::string> member_names;
    std::stringstream ss;
    JqrUtilCode rc = parseQuotedMemberName(ss);
    if (rc != JQRUTIL_SUCCESS) return rc;
    member_names.push_back(ss.str());
    TRACE("DEBUG", "parseNameInBrackets added member: " << ss.str())

    while (lex.matchToken(Token::COMMA, true)) {
        lex.skipSpaces();
        ss.str(std::string());
        rc = parseQuotedMemberName(ss);
        if (rc != JQRUTIL_SUCCESS) return rc;
        member_names.push_back(ss.str());
        TRACE("DEBUG", "parseNameInBrackets added member: " << ss.str())
    }

    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;

    PathStep step(member_names.size() == 1 ? PathStep::MEMBER : PathStep::MEMBER_UNION);
    step.names = std::move(member_names);
    expr.steps.push_back(std::move(step));
    return JQRUTIL_SUCCESS;
}

/**
 *   QuotedMemberName   ::= """ {char} """ | "'" {char} "'"
 */
JqrUtilCode PathCompiler::parseQuotedMemberName(std::stringstream &ss) {
    const Token &token = lex.currToken();
    if (token.type == Token::DOUBLE_QUOTE) {
        JqrUtilCode rc = lex.scanDoubleQuotedString(ss);
        if (rc != JQRUTIL_SUCCESS) return rc;
    } else if (token.type == Token::SINGLE_QUOTE) {
        JqrUtilCode rc = lex.scanSingleQuotedString(ss);
        if (rc != JQRUTIL_SUCCESS) return rc;
    } else {
        return JQRUTIL_INVALID_JSON_PATH;
    }
    TRACE("DEBUG", "parseQuotedMemberName member_name: " << ss.str())
    return JQRUTIL_SUCCESS;
}

/**
 *   IndexExpr           ::= Filter | SliceStartsWithColon | SliceOrUnionOrIndex
 */
JqrUtilCode PathCompiler::parseIndexExpr(PathExpression &expr) {
    switch (lex.currToken().type) {
        case Token::END:
        case Token::RBRACKET:
            return JQRUTIL_EMPTY_EXPR_TOKEN;
        case Token::QUESTION_MARK:
            return parseFilter(expr);
        case Token::COLON:
            return parseSliceStartsWithColon(expr);
        case Token::COMMA:
            return JQRUTIL_INVALID_JSON_PATH;  // union cannot start with comma
        default:
            return parseSliceOrUnionOrIndex(expr);
    }
}

/**
 *   SliceStartsWithColon ::= {SPACE} ":" [ {SPACE} ":" [Step] | {SPACE} EndAndStep ] ]
 */
JqrUtilCode PathCompiler::parseSliceStartsWithColon(PathExpression &expr) {
    PathStep slice(PathStep::SLICE);
    lex.nextToken(true);  // skip COLON
    switch (lex.currToken().type) {
        case Token::RBRACKET:
            return processSlice(slice, expr);
        case Token::COLON: {
            lex.nextToken(true);  // skip COLON
            return parseStep(slice, expr);
        }
        default:
            return parseEndAndStep(slice, expr);
    }
}

/**
 *   SliceOrUnionOrIndex    ::= SliceStartsWithInteger | UnionOfIndexes | Index
 */
JqrUtilCode PathCompiler::parseSliceOrUnionOrIndex(PathExpression &expr) {
    int64_t start;
    JqrUtilCode rc = parseIndex(start);
    if (rc != JQRUTIL_SUCCESS) return rc;

    lex.skipSpaces();
    switch (lex.currToken().type) {
        case Token::COLON: {
            PathStep slice(PathStep::SLICE);
            slice.hasStart = true;
            slice.start = start;
            return parseSliceStartsWithInteger(slice, expr);
        }
        case Token::COMMA:
            return parseUnionOfIndexes(start, expr);
        default:
            return processSubscript(start, expr);
    }
}

/**
 *   SliceStartsWithInteger ::= Start {SPACE} ":" {SPACE} [ ":" {SPACE} [Step] | EndAndStep
 */
JqrUtilCode PathCompiler::parseSliceStartsWithInteger(PathStep &slice, PathExpression &expr) {
    lex.nextToken(true);  // skip COLON

    lex.skipSpaces();
    switch (lex.currToken().type) {
        case Token::RBRACKET:
            return processSlice(slice, expr);
        case Token::COLON: {
            lex.nextToken();  // skip COLON
            return parseStep(slice, expr);
        }
        default:
            return parseEndAndStep(slice, expr);
    }
}

/**
 *   EndAndStep ::= End [{SPACE} ":" {SPACE} [Step]] ]
 */
JqrUtilCode PathCompiler::parseEndAndStep(PathStep &slice, PathExpression &expr) {
    JqrUtilCode rc = parseIndex(slice.end);
    if (rc != JQRUTIL_SUCCESS) return rc;
    slice.hasEnd = true;

    lex.skipSpaces();
    if (lex.currToken().type == Token::COLON) {
        lex.nextToken();  // skip COLON
        return parseStep(slice, expr);
    } else {
        return processSlice(slice, expr);
    }
}

JqrUtilCode PathCompiler::parseStep(PathStep &slice, PathExpression &expr) {
    lex.skipSpaces();
    if (lex.currToken().type != Token::RBRACKET) {
        JqrUtilCode rc = parseIndex(slice.step);
        if (rc != JQRUTIL_SUCCESS) return rc;
    }
    return processSlice(slice, expr);
}

JqrUtilCode PathCompiler::processSlice(PathStep &slice, PathExpression &expr) {
    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
    // Verify step cannot be 0.
    if (slice.step == 0) return JQRUTIL_STEP_CANNOT_NOT_BE_ZERO;
    TRACE("DEBUG", "processSlice start: " << slice.start << " end: " << slice.end << " step: " << slice.step)
    expr.steps.push_back(std::move(slice));
    return JQRUTIL_SUCCESS;
}

JqrUtilCode PathCompiler::parseIndex(int64_t &val) {
    JqrUtilCode rc = lex.scanInteger(val);
    if (rc == JQRUTIL_VALUE_NOT_NUMBER) rc = JQRUTIL_ARRAY_INDEX_NOT_NUMBER;
    return rc;
}

JqrUtilCode PathCompiler::processSubscript(const int64_t idx, PathExpression &expr) {
    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
    PathStep step(PathStep::INDEX);
    step.indexes.push_back(idx);
    expr.steps.push_back(std::move(step));
    return JQRUTIL_SUCCESS;
}

/**
 *   UnionOfIndexes      ::= Integer ({SPACE} "," {SPACE} Integer)+
 */
JqrUtilCode PathCompiler::parseUnionOfIndexes(const int64_t start, PathExpression &expr) {
    std::vector<int64_t> union_indices = {start};
    bool comma = false;
    int64_t index;
    JqrUtilCode rc;

    lex.skipSpaces();
    while (lex.currToken().type != Token::RBRACKET) {
        switch (lex.currToken().type) {
            case Token::END:
                return JQRUTIL_INVALID_JSON_PATH;
            case Token::COMMA: {
                // cannot have multiple commas in a row
                if (comma) return JQRUTIL_INVALID_JSON_PATH;
                comma = true;
                lex.nextToken(true);  // skip comma
                break;
            }
            default: {
                // integer must follow comma
                if (!comma) return JQRUTIL_INVALID_JSON_PATH;
                comma = false;
                lex.skipSpaces();
                rc = parseIndex(index);
                if (rc != JQRUTIL_SUCCESS) return rc;
                union_indices.push_back(index);
                break;
            }
        }
        lex.skipSpaces();
    }
    // cannot end with comma
    if (comma) return JQRUTIL_INVALID_JSON_PATH;

    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
    PathStep step(PathStep::INDEX_UNION);
    step.indexes = std::move(union_indices);
    expr.steps.push_back(std::move(step));
    return JQRUTIL_SUCCESS;
}

/**
 *   Filter              ::= "?" "(" FilterExpr ")"
 */
JqrUtilCode PathCompiler::parseFilter(PathExpression &expr) {
    lex.nextToken();  // skip QUESTION_MARK
    if (!lex.matchToken(Token::LPAREN)) return JQRUTIL_INVALID_JSON_PATH;
    PathStep step(PathStep::FILTER);
    JqrUtilCode rc = parseFilterExpr(step.filter);
    if (rc != JQRUTIL_SUCCESS) return rc;
    if (!lex.matchToken(Token::RPAREN)) return JQRUTIL_INVALID_JSON_PATH;

    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
    expr.steps.push_back(std::move(step));
    return JQRUTIL_SUCCESS;
}

/**
 *   FilterExpr          ::= {SPACE} Term { {SPACE} "||" {SPACE} Term {SPACE} }
 */
JqrUtilCode PathCompiler::parseFilterExpr(FilterExpr &filter) {
    CHECK_RECURSION_DEPTH();
    lex.skipSpaces();
    std::vector<FilterExpr> terms;
    terms.emplace_back();
    JqrUtilCode rc = parseTerm(terms.back());
    TRACE("DEBUG", "parseFilterExpr parsed first term, rc: " << rc)
    if (rc != JQRUTIL_SUCCESS) return rc;

    while (lex.matchToken(Token::OR, true)) {
        terms.emplace_back();
        rc = parseTerm(terms.back());
        TRACE("DEBUG", "parseFilterExpr parsed OR term, rc: " << rc)
        if (rc != JQRUTIL_SUCCESS) return rc;
    }
    lex.skipSpaces();

    if (terms.size() == 1) {
        filter = std::move(terms[0]);
    } else {
        filter.type = FilterExpr::OR;
        filter.children = std::move(terms);
    }
    return JQRUTIL_SUCCESS;
}

/**
 *   Term                ::= Factor { {SPACE} "&&" {SPACE} Factor }
 */
JqrUtilCode PathCompiler::parseTerm(FilterExpr &filter) {
    CHECK_RECURSION_DEPTH();
    std::vector<FilterExpr> factors;
    factors.emplace_back();
    JqrUtilCode rc = parseFactor(factors.back());
    if (rc != JQRUTIL_SUCCESS) return rc;
    while (lex.matchToken(Token::AND, true)) {
        factors.emplace_back();
        rc = parseFactor(factors.back());
        if (rc != JQRUTIL_SUCCESS) return rc;
    }

    if (factors.size() == 1) {
        filter = std::move(factors[0]);
    } else {
        filter.type = FilterExpr::AND;
        filter.children = std::move(factors);
    }
    return JQRUTIL_SUCCESS;
}

/**
 *   Factor              ::= ( "@" RelPath [ ComparisonOp ComparisonValue | ArrayContains ] ) |
 *                           ( ComparisonValue ComparisonOp "@" RelPath ) |
 *                           ( {SPACE} "(" FilterExpr ")" {SPACE} )
 */
JqrUtilCode PathCompiler::parseFactor(FilterExpr &filter) {
    CHECK_RECURSION_DEPTH();
    JqrUtilCode rc;
    lex.skipSpaces();
    if (lex.currToken().type == Token::LPAREN) {
        lex.nextToken(true);  // skip LPAREN
        rc = parseFilterExpr(filter);
        if (rc != JQRUTIL_SUCCESS) return rc;
        if (!lex.matchToken(Token::RPAREN, true)) return JQRUTIL_INVALID_JSON_PATH;
        return JQRUTIL_SUCCESS;
    }

    if (lex.matchToken(Token::AT)) {
        rc = parseRelPath(filter.operand);
        if (rc != JQRUTIL_SUCCESS) return rc;

        lex.skipSpaces();
        Token::TokenType tokenType = lex.currToken().type;
        if (tokenType == Token::LT || tokenType == Token::LE ||
            tokenType == Token::GT || tokenType == Token::GE ||
            tokenType == Token::EQ || tokenType == Token::NE) {
            filter.type = FilterExpr::COMPARISON;
            rc = parseComparisonOp(filter.op);
            if (rc != JQRUTIL_SUCCESS) return rc;
            return parseComparisonValue(filter);
        } else if (tokenType == Token::LBRACKET) {
            return parseArrayContains(filter);
        } else {
            // "@" alone is not a test
            if (filter.operand.empty()) return JQRUTIL_INVALID_JSON_PATH;
            filter.type = FilterExpr::EXISTS;
            return JQRUTIL_SUCCESS;
        }
    } else {  // see if the @.member_name is on the right, do an inverted comparison
        rc = parseComparisonValue(filter);
        if (rc != JQRUTIL_SUCCESS) return rc;

        lex.skipSpaces();
        filter.type = FilterExpr::COMPARISON;
        rc = parseComparisonOp(filter.op);
        if (rc != JQRUTIL_SUCCESS) return rc;
        rc = swapComparisonOpSide(filter.op);
        if (rc != JQRUTIL_SUCCESS) return rc;

        if (!lex.matchToken(Token::AT)) return JQRUTIL_INVALID_JSON_PATH;
        return parseRelPath(filter.operand);
    }
}

/**
 *   RelPath             ::= { ("." (UnquotedMemberName | BracketedMemberName)) | BracketedMemberName |
 *                             "[" Integer "]" }
 *
 * Stops in front of "[?", which starts an ArrayContains.
 */
JqrUtilCode PathCompiler::parseRelPath(RelPath &rel_path) {
    JqrUtilCode rc;
    while (true) {
        const Token::TokenType tokenType = lex.currToken().type;
        if (tokenType == Token::DOT) {
            StringViewHelper name;
            rc = parseMemberName(name);
            if (rc != JQRUTIL_SUCCESS) return rc;
            rel_path.push_back({false, std::string(name.getView()), 0});
        } else if (tokenType == Token::LBRACKET) {
            const char *q = lex.p;
            while (*q == ' ') q++;
            if (*q == '?') return JQRUTIL_SUCCESS;
            if (*q == '\'' || *q == '"') {
                StringViewHelper name;
                rc = parseMemberName(name);
                if (rc != JQRUTIL_SUCCESS) return rc;
                rel_path.push_back({false, std::string(name.getView()), 0});
            } else {
                lex.nextToken(true);  // skip LBRACKET
                int64_t index;
                rc = parseIndex(index);
                if (rc != JQRUTIL_SUCCESS) return rc;
                if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
                rel_path.push_back({true, std::string(), index});
            }
        } else {
            return JQRUTIL_SUCCESS;
        }
    }
}

/**
 *   MemberName         ::= ("." (UnquotedMemberName | BracketedMemberName)) | BracketedMemberName
 */
JqrUtilCode PathCompiler::parseMemberName(StringViewHelper &name) {
    if (lex.matchToken(Token::DOT)) {
        if (lex.matchToken(Token::LBRACKET))
            return parseBracketedMemberName(name);
        else
            return parseUnquotedMemberName(name);
    } else if (lex.matchToken(Token::LBRACKET)) {
        return parseBracketedMemberName(name);
    } else {
        return JQRUTIL_INVALID_JSON_PATH;
    }
}

/**
 *  BracketedMemberName ::= "[" {SPACE} QuotedMemberName {SPACE} "]"
 */
JqrUtilCode PathCompiler::parseBracketedMemberName(StringViewHelper &member_name) {
    lex.skipSpaces();
    std::stringstream ss;
    JqrUtilCode rc = parseQuotedMemberName(ss);
    if (rc != JQRUTIL_SUCCESS) return rc;
    if (!lex.matchToken(Token::RBRACKET, true)) return JQRUTIL_INVALID_JSON_PATH;
    member_name.setInternalString(ss.str());
    return JQRUTIL_SUCCESS;
}

/**
 *   ArrayContains       ::= "[" "?" "(" ( "@" ComparisonOp ComparisonValue | ComparisonValue ComparisonOp "@" )
 *                           ")" "]"
 */
JqrUtilCode PathCompiler::parseArrayContains(FilterExpr &filter) {
    JqrUtilCode rc;
    lex.nextToken(true);  // skip LBRACKET
    if (lex.currToken().type != Token::QUESTION_MARK) return JQRUTIL_INVALID_JSON_PATH;
    lex.nextToken(true);  // skip QUESTION_MARK
    if (!lex.matchToken(Token::LPAREN)) return JQRUTIL_INVALID_JSON_PATH;

    filter.type = FilterExpr::CONTAINS;
    if (lex.currToken().type == Token::AT) {
        lex.nextToken(true);  // skip AT

        rc = parseComparisonOp(filter.op);
        if (rc != JQRUTIL_SUCCESS) return rc;

        rc = parseComparisonValue(filter);
        if (rc != JQRUTIL_SUCCESS) return rc;
    } else {
        rc = parseComparisonValue(filter);
        if (rc != JQRUTIL_SUCCESS) return rc;

        rc = parseComparisonOp(filter.op);
        if (rc != JQRUTIL_SUCCESS) return rc;
        rc = swapComparisonOpSide(filter.op);
        if (rc != JQRUTIL_SUCCESS) return rc;

        if (!lex.matchToken(Token::AT)) return JQRUTIL_INVALID_JSON_PATH;
    }
    if (!lex.matchToken(Token::RPAREN, true)) return JQRUTIL_INVALID_JSON_PATH;
    if (!lex.matchToken(Token::RBRACKET)) return JQRUTIL_INVALID_JSON_PATH;
    return JQRUTIL_SUCCESS;
}

/**
 *   ComparisonValue     ::= "null" | Bool | Number | QuotedString | PartialPath
 *   Bool                ::= "true" | "false"
 *   Number              ::= Integer | ScientificNumber
 *   QuotedString        ::= "\"" {char} "\"" | "'" {char} "'"
 *   PartialPath         ::= "$" RelativePath
 */
JqrUtilCode PathCompiler::parseComparisonValue(FilterExpr &filter) {
    CHECK_RECURSION_DEPTH();
    StringViewHelper sv;
    const Token &token = lex.currToken();
    if (token.type == Token::DOLLAR) {  // compile the path, it is evaluated against the document later
        JqrUtilCode rc = lex.scanPathValue(sv);
        if (rc != JQRUTIL_SUCCESS) return rc;
        std::string path(sv.getView());
        filter.subPath.reset(new PathExpression());
        PathCompiler compiler;
        rc = compiler.compile(path.c_str(), *filter.subPath);
        if (rc != JQRUTIL_SUCCESS) {
            TRACE("ERROR", "parseComparisonValue failed to compile " << path)
            filter.subPath.reset();
            return rc;
        }
        return JQRUTIL_SUCCESS;
    }

    // parse value directly
    JParser parser;
    bool is_number = false;
    if (token.type == Token::DOUBLE_QUOTE) {
        JqrUtilCode rc = lex.scanDoubleQuotedString(parser);
        if (rc != JQRUTIL_SUCCESS) return rc;
        filter.literal = parser.GetJValue();
        TRACE("DEBUG", "parseComparisonValue ComparisonValue: " << filter.literal.GetString())
        return JQRUTIL_SUCCESS;
    } else if (token.type == Token::SINGLE_QUOTE) {
        std::stringstream ss;
        JqrUtilCode rc = lex.scanSingleQuotedStringAndConvertToDoubleQuotedString(ss);
        if (rc != JQRUTIL_SUCCESS) return rc;
        sv.setInternalString(ss.str());
    } else if (token.type == Token::ALPHA && (token.strVal == "n")) {
        JqrUtilCode rc = lex.scanIdentifier(sv);
        if (rc != JQRUTIL_SUCCESS) return rc;
        if (sv.getView() != "null") return JQRUTIL_INVALID_IDENTIFIER;
    } else if (token.type == Token::ALPHA && (token.strVal == "t" || token.strVal == "f")) {
        JqrUtilCode rc = lex.scanIdentifier(sv);
        if (rc != JQRUTIL_SUCCESS) return rc;
        if (sv.getView() != "true" && sv.getView() != "false") return JQRUTIL_INVALID_IDENTIFIER;
    } else {
        JqrUtilCode rc = lex.scanNumberInFilterExpr(sv);
        if (rc != JQRUTIL_SUCCESS) return rc;
        is_number = true;
    }

    if (parser.Parse(sv.getView().data(), sv.getView().length()).HasParseError()) {
        TRACE("DEBUG", "parseComparisonValue failed to parse " << sv.getView())
        return is_number ? JQRUTIL_INVALID_NUMBER : JQRUTIL_INVALID_JSON_PATH;
    }
    filter.literal = parser.GetJValue();
    return JQRUTIL_SUCCESS;
}

/**
 *   ComparisonOp        := {SPACE} "<" | "<="] | ">" | ">=" | "==" | "!=" {SPACE}
 */
JqrUtilCode PathCompiler::parseComparisonOp(Token::TokenType &op) {
    lex.skipSpaces();
    Token::TokenType tokenType = lex.currToken().type;
    if (tokenType != Token::EQ && tokenType != Token::NE &&
        tokenType != Token::LT && tokenType != Token::LE &&
        tokenType != Token::GT && tokenType != Token::GE)
        return JQRUTIL_INVALID_JSON_PATH;
    op = tokenType;
    lex.skipSpaces();

    lex.nextToken(true);  // advance to the next token
    TRACE("DEBUG", "parseComparisonOp op: " << op << ", curr path: " << lex.p)
    return JQRUTIL_SUCCESS;
}

JqrUtilCode PathCompiler::swapComparisonOpSide(Token::TokenType &op) {
    switch (op) {
        case Token::EQ:
        case Token::NE:
            return JQRUTIL_SUCCESS;
        case Token::GT:
            op = Token::LT;
            return JQRUTIL_SUCCESS;
        case Token::LT:
            op = Token::GT;
            return JQRUTIL_SUCCESS;
        case Token::GE:
            op = Token::LE;
            return JQRUTIL_SUCCESS;
        case Token::LE:
            op = Token::GE;
            return JQRUTIL_SUCCESS;
        default:
            return JQRUTIL_INVALID_JSON_PATH;
    }
}

/* ============================== Selector ============================== */

void Selector::getValues(const JValue &root, const PathExpression &expr) {
    this->root = &root;
    this->expr = &expr;
    resultSet.clear();
    computedValues.clear();
    subPathValues.clear();

    std::string path;
    evalStep(root, path, 0);
    if (expr.hasRecursive) dedupe();
    if (resultSet.empty() && expr.isDefinite()) addUnresolvedPath();
    TRACE("DEBUG", "getValues selected " << resultSet.size() << " values")
}

/**
 * Apply steps [idx, end) to value v. path is v's location in json pointer format. It is restored before
 * returning.
 */
void Selector::evalStep(const JValue &v, std::string &path, const size_t idx) {
    if (idx == expr->steps.size()) {
        resultSet.push_back({&v, path, DOCUMENT, 0});
        return;
    }

    const PathStep &step = expr->steps[idx];
    TRACE("DEBUG", "evalStep step " << idx << " type " << step.type << ", nodePath: " << path)
    switch (step.type) {
        case PathStep::MEMBER:
        case PathStep::MEMBER_UNION: {
            if (!v.IsObject()) return;
            for (auto &name : step.names) {
                JValue key(rapidjson::StringRef(name.data(), name.length()));
                JValue::ConstMemberIterator it = v.FindMember(key);
                if (it == v.MemberEnd()) continue;
                evalChild(it->value, path, name.data(), name.length(), idx + 1);
            }
            break;
        }
        case PathStep::INDEX:
        case PathStep::INDEX_UNION: {
            if (!v.IsArray()) return;
            for (int64_t i : step.indexes) {
                evalArrayIndex(v, path, i, idx + 1);
            }
            break;
        }
        case PathStep::WILDCARD: {
            if (v.IsObject()) {
                for (auto &m : v.GetObject()) {
                    evalChild(m.value, path, m.name.GetString(), m.name.GetStringLength(), idx + 1);
                }
            } else if (v.IsArray()) {
                for (int64_t i = 0; i < static_cast<int64_t>(v.Size()); i++) {
                    evalArrayIndex(v, path, i, idx + 1);
                }
            }
            break;
        }
        case PathStep::SLICE:
            processSlice(v, path, step, idx + 1);
            break;
        case PathStep::FILTER: {
            if (v.IsArray()) {
                for (int64_t i = 0; i < static_cast<int64_t>(v.Size()); i++) {
                    if (evalFilterExpr(step.filter, v[static_cast<rapidjson::SizeType>(i)]))
                        evalArrayIndex(v, path, i, idx + 1);
                }
            } else if (evalFilterExpr(step.filter, v)) {
                // a filter on an object or a scalar tests the value itself
                evalStep(v, path, idx + 1);
            }
            break;
        }
        case PathStep::RECURSIVE:
            recursiveSearch(v, path, idx + 1);
            break;
        case PathStep::LENGTH:
            processLength(v, path);
            break;
    }
}

void Selector::evalChild(const JValue &child, std::string &path, const char *token, const size_t len,
                         const size_t idx) {
    size_t path_len = path.length();
    jqrutil_append_pointer_token(path, token, len);
    evalStep(child, path, idx);
    path.resize(path_len);
}

/**
 * Negative index counts from the end. Out of bounds index selects nothing.
 */
void Selector::evalArrayIndex(const JValue &v, std::string &path, int64_t i, const size_t idx) {
    int64_t size = static_cast<int64_t>(v.Size());
    if (i < 0) i += size;
    if (i < 0 || i >= size) return;
    std::string token = std::to_string(i);
    evalChild(v[static_cast<rapidjson::SizeType>(i)], path, token.data(), token.length(), idx);
}

void Selector::processSlice(const JValue &v, std::string &path, const PathStep &step, const size_t idx) {
    if (!v.IsArray()) return;
    int64_t len = static_cast<int64_t>(v.Size());
    int64_t start;
    int64_t end;
    if (step.step > 0) {
        start = step.hasStart ? step.start : 0;
        end = step.hasEnd ? step.end : len;
    } else {
        start = step.hasStart ? step.start : len - 1;
        end = step.hasEnd ? step.end : -len - 1;
    }
    // handle negative index
    if (start < 0) start += len;
    if (end < 0) end += len;

    if (step.step > 0) {
        // if the index is out of bounds, round it to the respective bound.
        int64_t lower = std::min(std::max(start, int64_t(0)), len);
        int64_t upper = std::min(std::max(end, int64_t(0)), len);
        for (int64_t i = lower; i < upper; i += step.step) {
            evalArrayIndex(v, path, i, idx);
            if (step.step >= upper - i) break;  // the next index would pass the bound
        }
    } else {
        int64_t upper = std::min(std::max(start, int64_t(-1)), len - 1);
        int64_t lower = std::min(std::max(end, int64_t(-1)), len - 1);
        for (int64_t i = upper; i > lower; i += step.step) {
            evalArrayIndex(v, path, i, idx);
            if (step.step <= lower - i) break;
        }
    }
}

/**
 * length() of an array is the number of elements, of an object the number of members, of a string the number
 * of Unicode code points. Other values have no length.
 */
void Selector::processLength(const JValue &v, const std::string &path) {
    uint64_t len;
    if (v.IsArray()) {
        len = v.Size();
    } else if (v.IsObject()) {
        len = v.MemberCount();
    } else if (v.IsString()) {
        len = jqrutil_utf8_length(v.GetString(), v.GetStringLength());
    } else {
        return;
    }
    computedValues.emplace_back();
    computedValues.back().SetUint64(len);
    resultSet.push_back({nullptr, path, COMPUTED, computedValues.size() - 1});
}

/**
 * This DFS algorithm literally embodies "recursive descent":
 * 1. Run DFS on the subtree rooted from the current node (a.k.a. value).
 * 2. When each container node is visited, apply the remaining steps at the node.
 * 3. Selector::resultSet serves as the global result holding all selected values.
 */
void Selector::recursiveSearch(const JValue &v, std::string &path, const size_t idx) {
    if (!v.IsObject() && !v.IsArray()) return;

    // At the current node, apply the remaining steps.
    evalStep(v, path, idx);

    // Descend to each child (i.e., recursive descent)
    size_t path_len = path.length();
    if (v.IsObject()) {
        for (auto &m : v.GetObject()) {
            jqrutil_append_pointer_token(path, m.name.GetString(), m.name.GetStringLength());
            TRACE("DEBUG", "-> recursiveSearch descend to object member, nodePath: " << path)
            recursiveSearch(m.value, path, idx);
            path.resize(path_len);
        }
    } else {
        for (rapidjson::SizeType i = 0; i < v.Size(); i++) {
            std::string token = std::to_string(i);
            jqrutil_append_pointer_token(path, token.data(), token.length());
            TRACE("DEBUG", "-> recursiveSearch descend to array index " << i << ", nodePath: " << path)
            recursiveSearch(v[i], path, idx);
            path.resize(path_len);
        }
    }
}

bool Selector::evalFilterExpr(const FilterExpr &filter, const JValue &v) {
    switch (filter.type) {
        case FilterExpr::OR: {
            for (auto &child : filter.children) {
                if (evalFilterExpr(child, v)) return true;
            }
            return false;
        }
        case FilterExpr::AND: {
            for (auto &child : filter.children) {
                if (!evalFilterExpr(child, v)) return false;
            }
            return true;
        }
        case FilterExpr::EXISTS:
            return resolveRelPath(v, filter.operand) != nullptr;
        case FilterExpr::COMPARISON: {
            const JValue *lhs = resolveRelPath(v, filter.operand);
            if (lhs == nullptr) return false;
            const JValue *rhs = getComparisonValue(filter);
            if (rhs == nullptr) return false;
            return evalOp(lhs, filter.op, *rhs);
        }
        case FilterExpr::CONTAINS: {
            // We can enter an array and see if it contains an element that matches a condition.
            // This only looks down one level.
            const JValue *arr = resolveRelPath(v, filter.operand);
            if (arr == nullptr || !arr->IsArray()) return false;
            const JValue *rhs = getComparisonValue(filter);
            if (rhs == nullptr) return false;
            for (auto &e : arr->GetArray()) {
                if (evalOp(&e, filter.op, *rhs)) return true;
            }
            return false;
        }
    }
    return false;
}

const JValue *Selector::resolveRelPath(const JValue &v, const RelPath &rel_path) const {
    const JValue *curr = &v;
    for (auto &e : rel_path) {
        if (e.isIndex) {
            if (!curr->IsArray()) return nullptr;
            int64_t size = static_cast<int64_t>(curr->Size());
            int64_t i = e.index < 0 ? e.index + size : e.index;
            if (i < 0 || i >= size) return nullptr;
            curr = &(*curr)[static_cast<rapidjson::SizeType>(i)];
        } else {
            if (!curr->IsObject()) return nullptr;
            JValue key(rapidjson::StringRef(e.name.data(), e.name.length()));
            JValue::ConstMemberIterator it = curr->FindMember(key);
            if (it == curr->MemberEnd()) return nullptr;
            curr = &it->value;
        }
    }
    return curr;
}

/**
 * Get the right hand side of a comparison. A "$"-rooted path is evaluated against the document once per
 * evaluation, and must select exactly one scalar. Otherwise, the comparison is false.
 */
const JValue *Selector::getComparisonValue(const FilterExpr &filter) {
    if (!filter.subPath) return &filter.literal;

    auto it = subPathValues.find(&filter);
    if (it == subPathValues.end()) {
        std::unique_ptr<JValue> value;
        Selector selector;
        selector.getValues(*root, *filter.subPath);
        if (selector.resultSet.size() == 1) {
            const ValueInfo &vInfo = selector.resultSet[0];
            const JValue *src = nullptr;
            if (vInfo.origin == DOCUMENT)
                src = vInfo.value;
            else if (vInfo.origin == COMPUTED)
                src = &selector.computedValues[vInfo.computedIndex];
            if (src != nullptr && !src->IsObject() && !src->IsArray()) {
                value.reset(new JValue());
                value->CopyFrom(*src, allocator);
            }
        }
        it = subPathValues.emplace(&filter, std::move(value)).first;
    }
    return it->second.get();
}

template <typename T>
static int threeWay(const T a, const T b) {
    return (a > b) - (a < b);
}

STATIC bool compareNumbers(const JValue &a, const JValue &b, int &cmp) {
    if (a.IsDouble() || b.IsDouble()) {
        double x = a.GetDouble();
        double y = b.GetDouble();
        if (std::isnan(x) || std::isnan(y)) return false;
        cmp = threeWay(x, y);
    } else if (a.IsUint64() && b.IsUint64()) {
        cmp = threeWay(a.GetUint64(), b.GetUint64());
    } else if (a.IsInt64() && b.IsInt64()) {
        cmp = threeWay(a.GetInt64(), b.GetInt64());
    } else {
        // one is above INT64_MAX, the other is negative
        cmp = a.IsInt64() ? -1 : 1;
    }
    return true;
}

/**
 * Three-way comparison of two scalars of the same JSON type. true and false are the same type.
 * @param cmp - OUTPUT param, negative, zero or positive.
 * @return false if the values are not comparable: the types differ, one is a container, or a number is NaN.
 */
STATIC bool compareValues(const JValue &a, const JValue &b, int &cmp) {
    cmp = 0;
    if (a.IsBool() && b.IsBool()) {
        cmp = threeWay(static_cast<int>(a.GetBool()), static_cast<int>(b.GetBool()));
        return true;
    }
    if (a.GetType() != b.GetType()) return false;
    switch (a.GetType()) {
        case rapidjson::kNullType:
            return true;
        case rapidjson::kStringType:
            cmp = threeWay(dom_get_string_view(a).compare(dom_get_string_view(b)), 0);
            return true;
        case rapidjson::kNumberType:
            return compareNumbers(a, b, cmp);
        default:
            return false;
    }
}

bool Selector::evalOp(const JValue *v, const Token::TokenType op, const JValue &comparison_value) const {
    int cmp;
    if (!compareValues(*v, comparison_value, cmp)) return false;
    switch (op) {
        case Token::EQ: return cmp == 0;
        case Token::NE: return cmp != 0;
        case Token::LT: return cmp < 0;
        case Token::LE: return cmp <= 0;
        case Token::GT: return cmp > 0;
        case Token::GE: return cmp >= 0;
        default: return false;
    }
}

/**
 * A definite path that selects nothing still addresses one location. Record it so that the caller can
 * report the location as absent.
 */
void Selector::addUnresolvedPath() {
    std::string path;
    for (auto &step : expr->steps) {
        if (step.type == PathStep::MEMBER) {
            jqrutil_append_pointer_token(path, step.names[0].data(), step.names[0].length());
        } else if (step.type == PathStep::INDEX) {
            std::string token = std::to_string(step.indexes[0]);
            jqrutil_append_pointer_token(path, token.data(), token.length());
        }
    }
    resultSet.push_back({nullptr, path, UNRESOLVED, 0});
}

/**
 * Remove duplicate values from the result set, with order preserved. Two entries are duplicates if they
 * were selected at the same location.
 */
void Selector::dedupe() {
    if (resultSet.size() <= 1) return;

    TRACE("DEBUG", "dedupe resultSet size before dedupe: " << resultSet.size());
    std::unordered_set<std::string> set;
    std::vector<ValueInfo> uniqueResultSet;
    for (auto &v : resultSet) {
        auto res = set.emplace(v.path);
        if (res.second) uniqueResultSet.push_back(std::move(v));
    }
    resultSet.swap(uniqueResultSet);
    TRACE("DEBUG", "dedupe resultSet size after dedupe: " << resultSet.size());
}
