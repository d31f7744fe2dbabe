#ifndef REPORTCALC_EXPR_EXPR_PARSER_HPP
#define REPORTCALC_EXPR_EXPR_PARSER_HPP

#include "expr_ast.hpp"
#include <string>
#include <vector>

namespace reportcalc {
namespace expr {

enum class ParseMode {
    Formula,   // numbers only: string literals and f-strings are rejected
    Format     // string literals and f-strings allowed
};

struct Token {
    enum class Type { Number, Name, String, FString, Op, End };

    Type type;
    std::string text;        // source text (decoded content for strings)
    size_t position;
};

// Split source into tokens. Throws SafeEvalError(Syntax) for unterminated
// strings and characters that cannot start any token.
std::vector<Token> tokenize(const std::string& source);

// Recursive-descent parser for the whitelisted grammar
//
//   conditional := comparison ['if' comparison 'else' conditional]
//   comparison  := arith (('<'|'<='|'>'|'>='|'=='|'!=') arith)*
//   arith       := term (('+'|'-') term)*
//   term        := factor (('*'|'/'|'//'|'%') factor)*
//   factor      := ('+'|'-') factor | power
//   power       := primary ['**' factor]
//   primary     := NUMBER | STRING | FSTRING | NAME | NAME '(' args ')' | '(' conditional ')'
//
// Any other construct throws SafeEvalError before a tree is returned.
class Parser {
public:
    Parser(const std::string& source, ParseMode mode);

    NodePtr parse();

private:
    static constexpr size_t kMaxNesting = 200;

    std::string source_;
    ParseMode mode_;
    std::vector<Token> tokens_;
    size_t pos_;
    size_t nesting_;

    NodePtr parse_conditional();
    NodePtr parse_comparison();
    NodePtr parse_arith();
    NodePtr parse_term();
    NodePtr parse_factor();
    NodePtr parse_power();
    NodePtr parse_primary();
    NodePtr parse_call(const std::string& name);
    NodePtr parse_fstring(const Token& token);

    const Token& peek() const { return tokens_[pos_]; }
    const Token& consume() { return tokens_[pos_++]; }
    bool at_op(const std::string& op) const;
    bool at_keyword(const std::string& keyword) const;
    void expect_op(const std::string& op);
    void enter();
    void leave() { nesting_--; }

    [[noreturn]] void syntax_error(const std::string& message) const;
    [[noreturn]] void disallowed(const std::string& message) const;
    void check_postfix();
};

// Parse source and reject trees deeper than max_depth (TooComplex)
NodePtr parse_expression(const std::string& source, ParseMode mode, size_t max_depth);

} // namespace expr
} // namespace reportcalc

#endif // REPORTCALC_EXPR_EXPR_PARSER_HPP
