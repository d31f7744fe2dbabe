#include "expr_parser.hpp"
#include "eval_error.hpp"
#include "../value_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

namespace reportcalc {
namespace expr {

namespace {

constexpr size_t kMaxTokens = 4096;

const std::set<std::string>& two_char_ops() {
    static const std::set<std::string> ops = {
        "**", "//", "<=", ">=", "==", "!=", "<<", ">>", "->", ":="
    };
    return ops;
}

// Valid in the formulas' source language but outside the whitelist
const std::set<std::string>& disallowed_ops() {
    static const std::set<std::string> ops = {
        ".", "[", "]", "{", "}", "&", "|", "^", "~", "<<", ">>", "@", ":=", "->"
    };
    return ops;
}

const std::set<std::string>& reserved_words() {
    static const std::set<std::string> words = {
        "and", "or", "not", "is", "in", "lambda", "import", "from", "None",
        "for", "while", "yield", "await", "async", "del", "global", "nonlocal",
        "assert", "class", "def", "return", "with", "pass", "raise", "try",
        "except", "finally", "elif", "break", "continue", "as"
    };
    return words;
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string decode_escapes(const std::string& raw) {
    std::string out;
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) {
            out += c;
            continue;
        }
        char next = raw[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '0': out += '\0'; break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            default:
                out += '\\';
                out += next;
        }
    }
    return out;
}

[[noreturn]] void lex_error(SafeEvalErrorKind kind, const std::string& message, size_t position) {
    throw SafeEvalError(kind, message + " at position " + std::to_string(position));
}

} // anonymous namespace

// ============================================================================
// Tokenizer
// ============================================================================

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    size_t pos = 0;
    const size_t n = source.size();

    auto read_string = [&](size_t start, bool raw) -> std::string {
        char quote = source[pos];
        if (pos + 2 < n && source[pos + 1] == quote && source[pos + 2] == quote) {
            lex_error(SafeEvalErrorKind::DisallowedConstruct, "Triple-quoted strings are not allowed", start);
        }
        pos++;
        std::string content;
        while (pos < n && source[pos] != quote) {
            if (source[pos] == '\\' && pos + 1 < n) {
                content += source[pos];
                pos++;
            }
            content += source[pos];
            pos++;
        }
        if (pos >= n) {
            lex_error(SafeEvalErrorKind::Syntax, "Unterminated string literal", start);
        }
        pos++;  // closing quote
        return raw ? content : decode_escapes(content);
    };

    while (pos < n) {
        if (tokens.size() > kMaxTokens) {
            throw SafeEvalError(SafeEvalErrorKind::TooComplex, "Expression too long");
        }

        char c = source[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            pos++;
            continue;
        }

        size_t start = pos;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos + 1 < n && std::isdigit(static_cast<unsigned char>(source[pos + 1])))) {
            while (pos < n && (std::isdigit(static_cast<unsigned char>(source[pos])) || source[pos] == '_')) pos++;
            if (pos < n && source[pos] == '.') {
                pos++;
                while (pos < n && (std::isdigit(static_cast<unsigned char>(source[pos])) || source[pos] == '_')) pos++;
            }
            if (pos < n && (source[pos] == 'e' || source[pos] == 'E')) {
                size_t exp_start = pos;
                pos++;
                if (pos < n && (source[pos] == '+' || source[pos] == '-')) pos++;
                if (pos < n && std::isdigit(static_cast<unsigned char>(source[pos]))) {
                    while (pos < n && std::isdigit(static_cast<unsigned char>(source[pos]))) pos++;
                } else {
                    pos = exp_start;
                }
            }
            if (pos < n && is_name_char(source[pos])) {
                lex_error(SafeEvalErrorKind::Syntax, "Invalid numeric literal", start);
            }
            tokens.push_back({Token::Type::Number, source.substr(start, pos - start), start});
            continue;
        }

        if (is_name_start(c)) {
            while (pos < n && is_name_char(source[pos])) pos++;
            std::string name = source.substr(start, pos - start);

            if (pos < n && (source[pos] == '\'' || source[pos] == '"')) {
                std::string prefix = name;
                std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (prefix == "f") {
                    tokens.push_back({Token::Type::FString, read_string(start, false), start});
                } else if (prefix == "r") {
                    tokens.push_back({Token::Type::String, read_string(start, true), start});
                } else if (prefix == "u") {
                    tokens.push_back({Token::Type::String, read_string(start, false), start});
                } else {
                    lex_error(SafeEvalErrorKind::DisallowedConstruct, "String prefix '" + name + "' is not allowed", start);
                }
                continue;
            }

            tokens.push_back({Token::Type::Name, name, start});
            continue;
        }

        if (c == '\'' || c == '"') {
            tokens.push_back({Token::Type::String, read_string(start, false), start});
            continue;
        }

        if (pos + 1 < n) {
            std::string two = source.substr(pos, 2);
            if (two_char_ops().count(two)) {
                tokens.push_back({Token::Type::Op, two, start});
                pos += 2;
                continue;
            }
        }

        static const std::string single_ops = "+-*/%<>(),.[]{}=:;&|^~@!";
        if (single_ops.find(c) != std::string::npos) {
            tokens.push_back({Token::Type::Op, std::string(1, c), start});
            pos++;
            continue;
        }

        lex_error(SafeEvalErrorKind::Syntax, std::string("Unexpected character '") + c + "'", start);
    }

    tokens.push_back({Token::Type::End, "", n});
    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser(const std::string& source, ParseMode mode)
    : source_(source), mode_(mode), tokens_(tokenize(source)), pos_(0), nesting_(0) {}

NodePtr Parser::parse() {
    if (peek().type == Token::Type::End) {
        syntax_error("Empty expression");
    }

    NodePtr root = parse_conditional();
    if (peek().type != Token::Type::End) {
        const Token& token = peek();
        if (token.type == Token::Type::Op && token.text == "=") {
            disallowed("Assignment is not allowed");
        }
        if ((token.type == Token::Type::Op && disallowed_ops().count(token.text)) ||
            (token.type == Token::Type::Name && reserved_words().count(token.text))) {
            disallowed("'" + token.text + "' is not allowed");
        }
        syntax_error("Unexpected '" + token.text + "'");
    }
    return root;
}

void Parser::syntax_error(const std::string& message) const {
    throw SafeEvalError(SafeEvalErrorKind::Syntax,
                        "Invalid syntax: " + message + " at position " + std::to_string(peek().position));
}

void Parser::disallowed(const std::string& message) const {
    throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, message);
}

bool Parser::at_op(const std::string& op) const {
    return peek().type == Token::Type::Op && peek().text == op;
}

bool Parser::at_keyword(const std::string& keyword) const {
    return peek().type == Token::Type::Name && peek().text == keyword;
}

void Parser::expect_op(const std::string& op) {
    if (at_op(op)) {
        consume();
        return;
    }
    const Token& token = peek();
    if ((token.type == Token::Type::Op && disallowed_ops().count(token.text)) ||
        (token.type == Token::Type::Name && reserved_words().count(token.text))) {
        disallowed("'" + token.text + "' is not allowed");
    }
    if (token.type == Token::Type::Op && token.text == "=") {
        disallowed("Keyword arguments and assignments are not allowed");
    }
    syntax_error("Expected '" + op + "'");
}

void Parser::enter() {
    if (++nesting_ > kMaxNesting) {
        throw SafeEvalError(SafeEvalErrorKind::TooComplex, "Expression too complex");
    }
}

void Parser::check_postfix() {
    if (at_op(".")) {
        disallowed("Attribute access is not allowed");
    }
    if (at_op("[")) {
        disallowed("Subscripts are not allowed");
    }
    if (at_op("(")) {
        disallowed("Only simple function calls are allowed");
    }
}

NodePtr Parser::parse_conditional() {
    enter();
    NodePtr body = parse_comparison();
    if (at_keyword("if")) {
        consume();
        NodePtr test = parse_comparison();
        if (!at_keyword("else")) {
            syntax_error("Expected 'else' in conditional expression");
        }
        consume();
        NodePtr orelse = parse_conditional();

        auto node = std::make_unique<Node>(Node::Kind::Conditional);
        node->children.push_back(std::move(body));
        node->children.push_back(std::move(test));
        node->children.push_back(std::move(orelse));
        body = std::move(node);
    }
    leave();
    return body;
}

NodePtr Parser::parse_comparison() {
    NodePtr left = parse_arith();

    auto compare_op = [this](CompareOp& op) {
        if (peek().type != Token::Type::Op) return false;
        const std::string& text = peek().text;
        if (text == "<") op = CompareOp::Lt;
        else if (text == "<=") op = CompareOp::Le;
        else if (text == ">") op = CompareOp::Gt;
        else if (text == ">=") op = CompareOp::Ge;
        else if (text == "==") op = CompareOp::Eq;
        else if (text == "!=") op = CompareOp::Ne;
        else return false;
        return true;
    };

    CompareOp op;
    if (!compare_op(op)) {
        return left;
    }

    auto node = std::make_unique<Node>(Node::Kind::Compare);
    node->children.push_back(std::move(left));
    while (compare_op(op)) {
        consume();
        node->compare_ops.push_back(op);
        node->children.push_back(parse_arith());
    }
    return node;
}

NodePtr Parser::parse_arith() {
    NodePtr left = parse_term();
    while (at_op("+") || at_op("-")) {
        BinaryOp op = consume().text == "+" ? BinaryOp::Add : BinaryOp::Sub;
        auto node = std::make_unique<Node>(Node::Kind::Binary);
        node->binary_op = op;
        node->children.push_back(std::move(left));
        node->children.push_back(parse_term());
        left = std::move(node);
    }
    return left;
}

NodePtr Parser::parse_term() {
    NodePtr left = parse_factor();
    while (at_op("*") || at_op("/") || at_op("//") || at_op("%")) {
        const std::string& text = consume().text;
        BinaryOp op = text == "*" ? BinaryOp::Mul
                    : text == "/" ? BinaryOp::Div
                    : text == "//" ? BinaryOp::FloorDiv
                    : BinaryOp::Mod;
        auto node = std::make_unique<Node>(Node::Kind::Binary);
        node->binary_op = op;
        node->children.push_back(std::move(left));
        node->children.push_back(parse_factor());
        left = std::move(node);
    }
    return left;
}

NodePtr Parser::parse_factor() {
    if (at_op("-") || at_op("+")) {
        UnaryOp op = consume().text == "-" ? UnaryOp::Minus : UnaryOp::Plus;
        enter();
        auto node = std::make_unique<Node>(Node::Kind::Unary);
        node->unary_op = op;
        node->children.push_back(parse_factor());
        leave();
        return node;
    }
    return parse_power();
}

NodePtr Parser::parse_power() {
    NodePtr base = parse_primary();
    if (at_op("**")) {
        consume();
        enter();
        auto node = std::make_unique<Node>(Node::Kind::Binary);
        node->binary_op = BinaryOp::Pow;
        node->children.push_back(std::move(base));
        node->children.push_back(parse_factor());
        leave();
        return node;
    }
    return base;
}

NodePtr Parser::parse_primary() {
    const Token& token = peek();
    NodePtr node;

    switch (token.type) {
        case Token::Type::End:
            syntax_error("Unexpected end of expression");

        case Token::Type::Number: {
            std::string text = consume().text;
            text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
            node = std::make_unique<Node>(Node::Kind::Literal);
            bool is_float = text.find_first_of(".eE") != std::string::npos;
            auto as_int = is_float ? std::nullopt : parse_integer(text);
            if (as_int) {
                node->literal = *as_int;
            } else {
                node->literal = std::strtod(text.c_str(), nullptr);
            }
            break;
        }

        case Token::Type::String: {
            if (mode_ == ParseMode::Formula) {
                disallowed("String literals are not allowed in formulas");
            }
            node = std::make_unique<Node>(Node::Kind::Literal);
            node->literal = consume().text;
            break;
        }

        case Token::Type::FString: {
            if (mode_ == ParseMode::Formula) {
                disallowed("Formatted strings are not allowed in formulas");
            }
            Token fstring = consume();
            node = parse_fstring(fstring);
            break;
        }

        case Token::Type::Name: {
            std::string name = token.text;
            if (name == "True" || name == "False") {
                consume();
                node = std::make_unique<Node>(Node::Kind::Literal);
                node->literal = (name == "True");
                break;
            }
            if (reserved_words().count(name)) {
                disallowed("'" + name + "' is not allowed");
            }
            if (name == "if" || name == "else") {
                syntax_error("Unexpected '" + name + "'");
            }
            if (name.compare(0, 2, "__") == 0) {
                disallowed("Name '" + name + "' is not allowed");
            }
            consume();
            if (at_op("(")) {
                node = parse_call(name);
            } else {
                node = std::make_unique<Node>(Node::Kind::Name);
                node->name = name;
            }
            break;
        }

        case Token::Type::Op: {
            if (token.text == "(") {
                consume();
                if (at_op(")")) {
                    disallowed("Tuples are not allowed");
                }
                node = parse_conditional();
                if (at_op(",")) {
                    disallowed("Tuples are not allowed");
                }
                expect_op(")");
                break;
            }
            if (disallowed_ops().count(token.text)) {
                disallowed("'" + token.text + "' is not allowed");
            }
            if (token.text == "*" || token.text == "**") {
                disallowed("Unpacking is not allowed");
            }
            syntax_error("Unexpected '" + token.text + "'");
        }
    }

    check_postfix();
    return node;
}

NodePtr Parser::parse_call(const std::string& name) {
    if (!is_allowed_function(name)) {
        disallowed("Function not allowed: " + name);
    }
    expect_op("(");
    enter();

    auto node = std::make_unique<Node>(Node::Kind::Call);
    node->name = name;
    while (!at_op(")")) {
        if (at_op("*") || at_op("**")) {
            disallowed("Unpacking is not allowed");
        }
        node->children.push_back(parse_conditional());
        if (at_op("=")) {
            disallowed("Keyword arguments are not allowed");
        }
        if (at_op(",")) {
            consume();
            continue;
        }
        if (!at_op(")")) {
            expect_op(")");
        }
    }
    consume();  // ')'
    leave();
    return node;
}

NodePtr Parser::parse_fstring(const Token& token) {
    const std::string& content = token.text;
    auto node = std::make_unique<Node>(Node::Kind::FString);
    std::string text;

    auto flush_text = [&]() {
        if (!text.empty()) {
            FStringPart part;
            part.text = text;
            node->parts.push_back(std::move(part));
            text.clear();
        }
    };

    size_t i = 0;
    const size_t n = content.size();
    while (i < n) {
        char c = content[i];
        if (c == '}') {
            if (i + 1 < n && content[i + 1] == '}') {
                text += '}';
                i += 2;
                continue;
            }
            throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid syntax: f-string: single '}' is not allowed");
        }
        if (c != '{') {
            text += c;
            i++;
            continue;
        }
        if (i + 1 < n && content[i + 1] == '{') {
            text += '{';
            i += 2;
            continue;
        }

        flush_text();

        // Find the end of the embedded expression
        size_t j = i + 1;
        int depth = 0;
        char quote = 0;
        for (; j < n; ++j) {
            char ch = content[j];
            if (quote) {
                if (ch == quote) quote = 0;
                continue;
            }
            if (ch == '\'' || ch == '"') {
                quote = ch;
            } else if (ch == '(' || ch == '[' || ch == '{') {
                depth++;
            } else if (ch == ')' || ch == ']' || ch == '}') {
                if (depth == 0) break;
                depth--;
            } else if (depth == 0 && ch == ':') {
                break;
            } else if (depth == 0 && ch == '!' && (j + 1 >= n || content[j + 1] != '=')) {
                break;
            }
        }
        if (j >= n || content[j] == ')' || content[j] == ']') {
            throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid syntax: f-string: expecting '}'");
        }

        std::string expression = content.substr(i + 1, j - i - 1);
        if (trim(expression).empty()) {
            throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid syntax: f-string: empty expression not allowed");
        }
        if (content[j] == '!') {
            disallowed("f-string conversions are not allowed");
        }

        std::string spec;
        if (content[j] == ':') {
            size_t close = content.find('}', j + 1);
            if (close == std::string::npos) {
                throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid syntax: f-string: expecting '}'");
            }
            spec = content.substr(j + 1, close - j - 1);
            if (spec.find('{') != std::string::npos) {
                disallowed("Nested format specs are not allowed");
            }
            j = close;
        }

        Parser inner(expression, mode_);
        inner.nesting_ = nesting_ + 1;
        FStringPart part;
        part.expression = inner.parse();
        part.spec = parse_format_spec(spec);
        node->parts.push_back(std::move(part));

        i = j + 1;
    }
    flush_text();
    return node;
}

// ============================================================================
// Tree helpers
// ============================================================================

size_t tree_depth(const Node& node) {
    size_t deepest = 0;
    for (const auto& child : node.children) {
        deepest = std::max(deepest, tree_depth(*child));
    }
    for (const auto& part : node.parts) {
        if (part.expression) {
            deepest = std::max(deepest, tree_depth(*part.expression));
        }
    }
    return deepest + 1;
}

void collect_names(const Node& node, std::vector<std::string>& names) {
    if (node.kind == Node::Kind::Name) {
        names.push_back(node.name);
    }
    for (const auto& child : node.children) {
        collect_names(*child, names);
    }
    for (const auto& part : node.parts) {
        if (part.expression) {
            collect_names(*part.expression, names);
        }
    }
}

NodePtr parse_expression(const std::string& source, ParseMode mode, size_t max_depth) {
    Parser parser(source, mode);
    NodePtr root = parser.parse();
    if (tree_depth(*root) > max_depth) {
        throw SafeEvalError(SafeEvalErrorKind::TooComplex, "Expression too complex");
    }
    return root;
}

} // namespace expr
} // namespace reportcalc
