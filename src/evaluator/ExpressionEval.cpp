#include <cmath>

#include "BellaError.hpp"
#include "evaluator.hpp"
#include "number_format.hpp"

Value Evaluator::evaluate_expression(const Expression& expr, const EnvPtr& env) {
    return std::visit([&](const auto& node) -> Value { return eval(node, expr.token, env); }, expr.node);
}

Value Evaluator::eval(const NumeralNode& n, const Token&, const EnvPtr&) {
    return Value{n.value};
}

Value Evaluator::eval(const BoolNode& n, const Token&, const EnvPtr&) {
    return Value{n.value};
}

Value Evaluator::eval(const IdentifierNode& n, const Token& tok, const EnvPtr& env) {
    return env->lookup(n.name, tok.loc);
}

Value Evaluator::eval(const UnaryExpressionNode& u, const Token& tok, const EnvPtr& env) {
    if (u.op != "-" && u.op != "!") {
        throw UnknownOperatorError("Unknown unary operator '" + u.op + "'.", tok.loc);
    }

    Value operand = evaluate_expression(*u.operand, env);
    if (u.op == "-") return Value{-to_number(operand, "operand of unary '-'", tok)};
    return Value{!to_bool(operand, "operand of '!'", tok)};
}

Value Evaluator::eval(const BinaryExpressionNode& b, const Token& tok, const EnvPtr& env) {
    const std::string& op = b.op;

    // Logical operators short-circuit: the right operand only runs when the left
    // one does not decide the result.
    if (op == "&&") {
        if (!to_bool(evaluate_expression(*b.left, env), "left operand of '&&'", tok)) return Value{false};
        return Value{to_bool(evaluate_expression(*b.right, env), "right operand of '&&'", tok)};
    }
    if (op == "||") {
        if (to_bool(evaluate_expression(*b.left, env), "left operand of '||'", tok)) return Value{true};
        return Value{to_bool(evaluate_expression(*b.right, env), "right operand of '||'", tok)};
    }

    Value left = evaluate_expression(*b.left, env);
    Value right = evaluate_expression(*b.right, env);

    auto operands = [&](double& l, double& r) {
        l = to_number(left, "left operand of '" + op + "'", tok);
        r = to_number(right, "right operand of '" + op + "'", tok);
    };
    double l = 0.0;
    double r = 0.0;

    // Division and modulo by zero follow IEEE-754 (Infinity / NaN), never an error.
    if (op == "+") { operands(l, r); return Value{l + r}; }
    if (op == "-") { operands(l, r); return Value{l - r}; }
    if (op == "*") { operands(l, r); return Value{l * r}; }
    if (op == "/") { operands(l, r); return Value{l / r}; }
    if (op == "%") { operands(l, r); return Value{std::fmod(l, r)}; }
    if (op == "**") { operands(l, r); return Value{std::pow(l, r)}; }

    if (op == "<") { operands(l, r); return Value{l < r}; }
    if (op == "<=") { operands(l, r); return Value{l <= r}; }
    if (op == "==") { operands(l, r); return Value{l == r}; }
    if (op == "!=") { operands(l, r); return Value{l != r}; }
    if (op == ">=") { operands(l, r); return Value{l >= r}; }
    if (op == ">") { operands(l, r); return Value{l > r}; }

    throw UnknownOperatorError("Unknown binary operator '" + op + "'.", tok.loc);
}

Value Evaluator::eval(const ConditionalExpressionNode& c, const Token& tok, const EnvPtr& env) {
    // only the selected branch is evaluated
    if (to_bool(evaluate_expression(*c.test, env), "conditional test", tok)) {
        return evaluate_expression(*c.consequent, env);
    }
    return evaluate_expression(*c.alternate, env);
}

Value Evaluator::eval(const ArrayLiteralNode& a, const Token&, const EnvPtr& env) {
    auto arrVal = std::make_shared<ArrayValue>();
    arrVal->elements.reserve(a.elements.size());
    for (const auto& elem : a.elements) {
        arrVal->elements.push_back(evaluate_expression(*elem, env));
    }
    return Value{arrVal};
}

Value Evaluator::eval(const SubscriptNode& s, const Token& tok, const EnvPtr& env) {
    Value target = evaluate_expression(*s.array, env);
    if (!std::holds_alternative<ArrayPtr>(target)) {
        throw TypeError("Cannot subscript a value of type " + type_name(target) + "; expected array.", tok.loc);
    }
    ArrayPtr arr = std::get<ArrayPtr>(target);

    Value indexVal = evaluate_expression(*s.index, env);
    if (!std::holds_alternative<double>(indexVal)) {
        throw TypeError("Array index must be a number, got " + type_name(indexVal) + ".", tok.loc);
    }
    double index = std::get<double>(indexVal);
    if (!std::isfinite(index) || std::floor(index) != index) {
        throw TypeError("Array index must be an integer, got " + format_number(index) + ".", tok.loc);
    }

    if (index < 0 || index >= static_cast<double>(arr->elements.size())) {
        throw IndexOutOfRangeError(
            "Index " + format_number(index) + " is out of range for array of length " +
                std::to_string(arr->elements.size()) + ".",
            tok.loc);
    }
    return arr->elements[static_cast<size_t>(index)];
}
