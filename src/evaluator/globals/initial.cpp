#include <cmath>
#include <numbers>

#include "evaluator.hpp"
#include "globals.hpp"

static Value builtin_sin(const std::vector<double>& args) {
    return Value{std::sin(args[0])};
}

static Value builtin_cos(const std::vector<double>& args) {
    return Value{std::cos(args[0])};
}

static Value builtin_hypot(const std::vector<double>& args) {
    return Value{std::hypot(args[0], args[1])};
}

static Value builtin_sqrt(const std::vector<double>& args) {
    return Value{std::sqrt(args[0])};
}

static Value builtin_exp(const std::vector<double>& args) {
    return Value{std::exp(args[0])};
}

// natural logarithm
static Value builtin_ln(const std::vector<double>& args) {
    return Value{std::log(args[0])};
}

void init_globals(EnvPtr env) {
    if (!env) return;

    // arity is checked by the caller before the impl runs
    auto add = [&](const std::string& name, size_t arity, NativeImpl impl) {
        env->declare(name, Value{std::make_shared<FunctionValue>(name, arity, std::move(impl))});
    };

    add("sin", 1, builtin_sin);
    add("cos", 1, builtin_cos);
    add("hypot", 2, builtin_hypot);
    add("sqrt", 1, builtin_sqrt);
    add("exp", 1, builtin_exp);
    add("ln", 1, builtin_ln);

    env->declare("π", Value{std::numbers::pi});
}
