#pragma once
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "token.hpp"

// The tree is immutable once built. Children are shared, never mutated, so a
// closure can keep its body alive without cloning it.
struct Expression;
struct Statement;
using ExprPtr = std::shared_ptr<const Expression>;
using StmtPtr = std::shared_ptr<const Statement>;

// ----------------- Expressions -----------------

struct NumeralNode {
    double value = 0.0;
};

struct BoolNode {
    bool value = false;
};

struct IdentifierNode {
    std::string name;
};

struct UnaryExpressionNode {
    std::string op;  // "-" or "!"
    ExprPtr operand;
};

struct BinaryExpressionNode {
    std::string op;  // e.g. "+", "**", "<=", "&&"
    ExprPtr left;
    ExprPtr right;
};

// test ? consequent : alternate
struct ConditionalExpressionNode {
    ExprPtr test;
    ExprPtr consequent;
    ExprPtr alternate;
};

struct CallExpressionNode {
    IdentifierNode callee;
    std::vector<ExprPtr> arguments;
};

struct ArrayLiteralNode {
    std::vector<ExprPtr> elements;
};

struct SubscriptNode {
    ExprPtr array;
    ExprPtr index;
};

struct Expression {
    using Variant = std::variant<
        NumeralNode,
        BoolNode,
        IdentifierNode,
        UnaryExpressionNode,
        BinaryExpressionNode,
        ConditionalExpressionNode,
        CallExpressionNode,
        ArrayLiteralNode,
        SubscriptNode>;

    Variant node;
    Token token;  // filename, line, column for this node (set by the parser)

    std::string to_string() const;
};

// ----------------- Statements -----------------

struct BlockNode {
    std::vector<StmtPtr> statements;
};

struct VariableDeclarationNode {
    IdentifierNode id;
    ExprPtr initializer;
};

struct AssignmentNode {
    IdentifierNode target;
    ExprPtr source;
};

struct PrintStatementNode {
    ExprPtr expression;
};

struct WhileStatementNode {
    ExprPtr condition;
    BlockNode body;
};

// fun name(params) = body
struct FunctionDeclarationNode {
    IdentifierNode name;
    std::vector<IdentifierNode> parameters;
    ExprPtr body;
};

struct Statement {
    using Variant = std::variant<
        VariableDeclarationNode,
        AssignmentNode,
        PrintStatementNode,
        WhileStatementNode,
        FunctionDeclarationNode>;

    Variant node;
    Token token;

    std::string to_string() const;
};

struct ProgramNode {
    BlockNode body;
};

// Builders used by the parser and by code that assembles trees by hand.
template <typename T>
ExprPtr make_expression(T node, const Token& token = Token{}) {
    return std::make_shared<const Expression>(Expression{Expression::Variant(std::move(node)), token});
}

template <typename T>
StmtPtr make_statement(T node, const Token& token = Token{}) {
    return std::make_shared<const Statement>(Statement{Statement::Variant(std::move(node)), token});
}

std::string block_to_string(const BlockNode& block, int indent = 0);
