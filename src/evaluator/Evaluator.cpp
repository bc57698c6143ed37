// src/evaluator/Evaluator.cpp
#include <iostream>

#include "colors.hpp"
#include "evaluator.hpp"
#include "globals.hpp"

namespace {
// Records where the native stack starts for one top-level run so deep recursion
// can be measured against it. Nested entries keep the outermost base.
class StackBaseGuard {
   public:
    explicit StackBaseGuard(std::uintptr_t& base) : base_(base), owner_(base == 0) {
        if (owner_) {
            volatile char marker = 0;
            base_ = reinterpret_cast<std::uintptr_t>(&marker);
        }
    }
    ~StackBaseGuard() {
        if (owner_) base_ = 0;
    }
    StackBaseGuard(const StackBaseGuard&) = delete;
    StackBaseGuard& operator=(const StackBaseGuard&) = delete;

   private:
    std::uintptr_t& base_;
    bool owner_;
};
}  // namespace

Evaluator::Evaluator() : Evaluator(std::cout) {}

Evaluator::Evaluator(std::ostream& out) : global_env(std::make_shared<Environment>(nullptr)), out_(&out) {
    init_globals(global_env);
}

Evaluator::~Evaluator() = default;

// ----------------- Program evaluation -----------------
void Evaluator::evaluate(const ProgramNode& program) {
    StackBaseGuard guard(stack_base_);
    execute_block(program.body, global_env);
}

Value Evaluator::evaluate_expression(const Expression& expr) {
    StackBaseGuard guard(stack_base_);
    return evaluate_expression(expr, global_env);
}

std::string Evaluator::cerr_colored(const std::string& s) {
    static bool use_color = Color::supports_color(STDERR_FILENO);
    return use_color ? Color::red + s + Color::reset : s;
}
