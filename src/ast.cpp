#include "ast.hpp"

#include "number_format.hpp"

static std::string expr_str(const ExprPtr& e) {
    return e ? e->to_string() : "<null>";
}

namespace {
struct ExpressionPrinter {
    std::string operator()(const NumeralNode& n) const { return format_number(n.value); }
    std::string operator()(const BoolNode& n) const { return n.value ? "true" : "false"; }
    std::string operator()(const IdentifierNode& n) const { return n.name; }
    std::string operator()(const UnaryExpressionNode& n) const {
        return "(" + n.op + expr_str(n.operand) + ")";
    }
    std::string operator()(const BinaryExpressionNode& n) const {
        return "(" + expr_str(n.left) + " " + n.op + " " + expr_str(n.right) + ")";
    }
    std::string operator()(const ConditionalExpressionNode& n) const {
        return "(" + expr_str(n.test) + " ? " + expr_str(n.consequent) + " : " + expr_str(n.alternate) + ")";
    }
    std::string operator()(const CallExpressionNode& n) const {
        std::string args;
        for (size_t i = 0; i < n.arguments.size(); ++i) {
            if (i) args += ", ";
            args += expr_str(n.arguments[i]);
        }
        return n.callee.name + "(" + args + ")";
    }
    std::string operator()(const ArrayLiteralNode& n) const {
        std::string out = "[";
        for (size_t i = 0; i < n.elements.size(); ++i) {
            if (i) out += ", ";
            out += expr_str(n.elements[i]);
        }
        return out + "]";
    }
    std::string operator()(const SubscriptNode& n) const {
        return expr_str(n.array) + "[" + expr_str(n.index) + "]";
    }
};

struct StatementPrinter {
    int indent;

    std::string operator()(const VariableDeclarationNode& s) const {
        return s.id.name + " := " + expr_str(s.initializer);
    }
    std::string operator()(const AssignmentNode& s) const {
        return s.target.name + " = " + expr_str(s.source);
    }
    std::string operator()(const PrintStatementNode& s) const {
        return "print " + expr_str(s.expression);
    }
    std::string operator()(const WhileStatementNode& s) const {
        return "while " + expr_str(s.condition) + " {\n" +
            block_to_string(s.body, indent + 2) +
            std::string(indent, ' ') + "}";
    }
    std::string operator()(const FunctionDeclarationNode& s) const {
        std::string params;
        for (size_t i = 0; i < s.parameters.size(); ++i) {
            if (i) params += ", ";
            params += s.parameters[i].name;
        }
        return "fun " + s.name.name + "(" + params + ") = " + expr_str(s.body);
    }
};
}  // namespace

std::string Expression::to_string() const {
    return std::visit(ExpressionPrinter{}, node);
}

std::string Statement::to_string() const {
    return std::visit(StatementPrinter{0}, node);
}

std::string block_to_string(const BlockNode& block, int indent) {
    std::string out;
    for (const auto& stmt : block.statements) {
        out += std::string(indent, ' ');
        out += stmt ? std::visit(StatementPrinter{indent}, stmt->node) : "<null>";
        out += "\n";
    }
    return out;
}
