#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// Forward-declare ArrayValue so Value can hold a pointer to it (avoids recursive-instantiation issues)
struct ArrayValue;
using ArrayPtr = std::shared_ptr<ArrayValue>;

using Value = std::variant<
    double,
    bool,
    ArrayPtr,
    FunctionPtr>;

struct ArrayValue {
    std::vector<Value> elements;
};

using NativeImpl = std::function<Value(const std::vector<double>&)>;

// Function value: either a native built-in or a closure with parameters, body
// and defining environment.
struct FunctionValue {
    std::string name;
    bool is_native = false;

    // native
    size_t native_arity = 0;
    NativeImpl native_impl;

    // closure
    std::vector<std::string> parameters;
    ExprPtr body;
    // The frame chain keeps the captured frame alive; holding it weakly keeps a
    // frame that stores its own closure from owning itself.
    std::weak_ptr<Environment> closure;
    Token token;

    FunctionValue(
        const std::string& nm,
        const std::vector<std::string>& params,
        const ExprPtr& b,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            is_native(false),
                            parameters(params),
                            body(b),
                            closure(env),
                            token(tok) {
    }

    FunctionValue(
        const std::string& nm,
        size_t arity,
        NativeImpl impl) : name(nm),
                           is_native(true),
                           native_arity(arity),
                           native_impl(std::move(impl)) {
    }

    size_t arity() const { return is_native ? native_arity : parameters.size(); }
};

// Environment with lexical parent pointer
class Environment : public std::enable_shared_from_this<Environment> {
   public:
    explicit Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    // map from name -> value
    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;

    // check only this frame
    bool has_own(const std::string& name) const;

    // bind a new name in this frame. Throws RedeclarationError if this frame already binds it.
    void declare(const std::string& name, const Value& value, const TokenLocation& loc = {});

    // rebind the nearest existing binding. Throws UnboundVariableError if none.
    void assign(const std::string& name, const Value& value, const TokenLocation& loc = {});

    // read the nearest binding. Throws UnboundVariableError if none.
    const Value& lookup(const std::string& name, const TokenLocation& loc = {}) const;

    // fresh frame under `parent` holding `bindings`; lives for one call
    static EnvPtr child_frame(const EnvPtr& parent,
        const std::vector<std::pair<std::string, Value>>& bindings,
        const TokenLocation& loc = {});
};

// Evaluator
class Evaluator {
   public:
    Evaluator();
    explicit Evaluator(std::ostream& out);
    ~Evaluator();

    // Run a whole program in the root frame. Errors propagate to the caller unmodified.
    void evaluate(const ProgramNode& program);

    // Evaluate a single expression in the root frame.
    Value evaluate_expression(const Expression& expr);

    std::string value_to_string(const Value& v) const;
    static std::string type_name(const Value& v);
    static std::string cerr_colored(const std::string& s);

    EnvPtr global_environment() const { return global_env; }

    // Expression & statement evaluators. Pass the environment explicitly for lexical scoping.
    Value evaluate_expression(const Expression& expr, const EnvPtr& env);
    void execute_statement(const Statement& stmt, const EnvPtr& env);
    void execute_block(const BlockNode& block, const EnvPtr& env);

   private:
    EnvPtr global_env;
    std::ostream* out_;

    // Address near the bottom of the native stack for the current run (0 when idle).
    std::uintptr_t stack_base_ = 0;
    // Leave headroom below the usual 8MB default stack.
    static constexpr std::uintptr_t kStackLimit = 6 * 1024 * 1024;
    bool is_stack_near_limit() const;

    Value call_function(const FunctionPtr& fn, const std::vector<Value>& args, const Token& callToken);

    // one overload per expression form
    Value eval(const NumeralNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const BoolNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const IdentifierNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const UnaryExpressionNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const BinaryExpressionNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const ConditionalExpressionNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const CallExpressionNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const ArrayLiteralNode& n, const Token& tok, const EnvPtr& env);
    Value eval(const SubscriptNode& n, const Token& tok, const EnvPtr& env);

    // one overload per statement form
    void exec(const VariableDeclarationNode& s, const Token& tok, const EnvPtr& env);
    void exec(const AssignmentNode& s, const Token& tok, const EnvPtr& env);
    void exec(const PrintStatementNode& s, const Token& tok, const EnvPtr& env);
    void exec(const WhileStatementNode& s, const Token& tok, const EnvPtr& env);
    void exec(const FunctionDeclarationNode& s, const Token& tok, const EnvPtr& env);

    // helpers: checked conversions (throw TypeError naming `what`)
    double to_number(const Value& v, const std::string& what, const Token& token) const;
    bool to_bool(const Value& v, const std::string& what, const Token& token) const;

    std::string print_array(const ArrayPtr& arr) const;
};
