#ifndef REPORTCALC_EXPR_EXPR_AST_HPP
#define REPORTCALC_EXPR_EXPR_AST_HPP

#include "expr_value.hpp"
#include "format_spec.hpp"
#include <memory>
#include <string>
#include <vector>

namespace reportcalc {
namespace expr {

struct Node;
using NodePtr = std::unique_ptr<Node>;

// One piece of an f-string: literal text, or an expression with its spec
struct FStringPart {
    std::string text;
    NodePtr expression;      // null for literal text
    FormatSpec spec;
};

// Expression tree. Only these node kinds exist; anything else is rejected
// by the parser before a tree is built.
struct Node {
    enum class Kind {
        Literal,       // literal
        Name,          // name
        Unary,         // unary_op, children[0]
        Binary,        // binary_op, children[0..1]
        Compare,       // compare_ops, children[0..n]
        Conditional,   // children: body, test, orelse
        Call,          // name, children = arguments
        FString        // parts
    };

    Kind kind;
    ExprValue literal;
    std::string name;
    UnaryOp unary_op;
    BinaryOp binary_op;
    std::vector<CompareOp> compare_ops;
    std::vector<NodePtr> children;
    std::vector<FStringPart> parts;

    explicit Node(Kind kind_)
        : kind(kind_), literal(0LL), unary_op(UnaryOp::Plus), binary_op(BinaryOp::Add) {}
};

// Levels from the root to the deepest leaf (a single literal has depth 1)
size_t tree_depth(const Node& node);

// Every Name referenced by the tree, in order of appearance
void collect_names(const Node& node, std::vector<std::string>& names);

} // namespace expr
} // namespace reportcalc

#endif // REPORTCALC_EXPR_EXPR_AST_HPP
