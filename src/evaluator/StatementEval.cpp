#include "BellaError.hpp"
#include "evaluator.hpp"

void Evaluator::execute_statement(const Statement& stmt, const EnvPtr& env) {
    std::visit([&](const auto& node) { exec(node, stmt.token, env); }, stmt.node);
}

// A block shares the environment it runs in; only calls open new frames.
void Evaluator::execute_block(const BlockNode& block, const EnvPtr& env) {
    for (const auto& stmt : block.statements) {
        execute_statement(*stmt, env);
    }
}

void Evaluator::exec(const VariableDeclarationNode& vd, const Token& tok, const EnvPtr& env) {
    Value val = evaluate_expression(*vd.initializer, env);
    env->declare(vd.id.name, val, tok.loc);
}

void Evaluator::exec(const AssignmentNode& an, const Token& tok, const EnvPtr& env) {
    Value rhs = evaluate_expression(*an.source, env);
    env->assign(an.target.name, rhs, tok.loc);
}

void Evaluator::exec(const PrintStatementNode& ps, const Token&, const EnvPtr& env) {
    *out_ << value_to_string(evaluate_expression(*ps.expression, env)) << std::endl;
}

void Evaluator::exec(const WhileStatementNode& wn, const Token& tok, const EnvPtr& env) {
    while (to_bool(evaluate_expression(*wn.condition, env), "while condition", tok)) {
        execute_block(wn.body, env);
    }
}

void Evaluator::exec(const FunctionDeclarationNode& fd, const Token& tok, const EnvPtr& env) {
    std::vector<std::string> params;
    params.reserve(fd.parameters.size());
    for (const auto& p : fd.parameters) params.push_back(p.name);

    auto fn = std::make_shared<FunctionValue>(fd.name.name, params, fd.body, env, tok);
    env->declare(fd.name.name, Value{fn}, tok.loc);
}
