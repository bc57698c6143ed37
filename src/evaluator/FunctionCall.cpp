// src/evaluator/FunctionCall.cpp
#include "BellaError.hpp"
#include "evaluator.hpp"

bool Evaluator::is_stack_near_limit() const {
    if (stack_base_ == 0) return false;

    // Get approximate stack pointer address
    volatile char stack_var = 0;
    std::uintptr_t current_sp = reinterpret_cast<std::uintptr_t>(&stack_var);

    std::uintptr_t stack_used = (stack_base_ > current_sp)
        ? (stack_base_ - current_sp)   // Stack grows down (most systems)
        : (current_sp - stack_base_);  // Stack grows up (rare)

    return stack_used > kStackLimit;
}

Value Evaluator::eval(const CallExpressionNode& call, const Token& tok, const EnvPtr& env) {
    Value calleeVal = env->lookup(call.callee.name, tok.loc);
    if (!std::holds_alternative<FunctionPtr>(calleeVal)) {
        throw NotCallableError(
            "'" + call.callee.name + "' is a " + type_name(calleeVal) + ", not a function.",
            tok.loc);
    }

    std::vector<Value> args;
    args.reserve(call.arguments.size());
    for (const auto& arg : call.arguments) {
        args.push_back(evaluate_expression(*arg, env));
    }

    return call_function(std::get<FunctionPtr>(calleeVal), args, tok);
}

Value Evaluator::call_function(const FunctionPtr& fn, const std::vector<Value>& args, const Token& callToken) {
    if (args.size() != fn->arity()) {
        throw ArityMismatchError(
            "Function '" + fn->name + "' expects " + std::to_string(fn->arity()) +
                " argument(s) but was called with " + std::to_string(args.size()) + ".",
            callToken.loc);
    }

    if (fn->is_native) {
        std::vector<double> numbers;
        numbers.reserve(args.size());
        for (size_t i = 0; i < args.size(); ++i) {
            numbers.push_back(to_number(args[i], "argument " + std::to_string(i + 1) + " of '" + fn->name + "'", callToken));
        }
        return fn->native_impl(numbers);
    }

    EnvPtr captured = fn->closure.lock();
    if (!captured) {
        std::string where = fn->token.loc.known() ? " (declared at " + fn->token.loc.to_string() + ")" : "";
        throw RuntimeError("The scope of function '" + fn->name + "'" + where + " no longer exists.", callToken.loc);
    }

    if (is_stack_near_limit()) {
        throw StackOverflowError("Maximum call stack size exceeded while calling '" + fn->name + "'.", callToken.loc);
    }

    std::vector<std::pair<std::string, Value>> bindings;
    bindings.reserve(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
        bindings.emplace_back(fn->parameters[i], args[i]);
    }

    // The call frame dies with this scope; nothing leaks back to the caller.
    EnvPtr frame = Environment::child_frame(captured, bindings, callToken.loc);
    return evaluate_expression(*fn->body, frame);
}
