#include "BellaError.hpp"
#include "evaluator.hpp"
#include "number_format.hpp"

std::string Evaluator::type_name(const Value& v) {
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<ArrayPtr>(v)) return "array";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    return "unknown";
}

double Evaluator::to_number(const Value& v, const std::string& what, const Token& token) const {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    throw TypeError("Expected a number for " + what + ", got " + type_name(v) + ".", token.loc);
}

bool Evaluator::to_bool(const Value& v, const std::string& what, const Token& token) const {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    throw TypeError("Expected a boolean for " + what + ", got " + type_name(v) + ".", token.loc);
}

std::string Evaluator::print_array(const ArrayPtr& arr) const {
    if (!arr) return "[]";
    std::string out = "[";
    for (size_t i = 0; i < arr->elements.size(); ++i) {
        if (i) out += ", ";
        out += value_to_string(arr->elements[i]);
    }
    out += "]";
    return out;
}

std::string Evaluator::value_to_string(const Value& v) const {
    if (std::holds_alternative<double>(v)) return format_number(std::get<double>(v));
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<ArrayPtr>(v)) return print_array(std::get<ArrayPtr>(v));
    if (std::holds_alternative<FunctionPtr>(v)) {
        FunctionPtr fn = std::get<FunctionPtr>(v);
        if (!fn) return "<function>";
        return std::string(fn->is_native ? "<native " : "<function ") + fn->name + ">";
    }
    return "unknown";
}
