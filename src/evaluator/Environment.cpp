//src/evaluator/Environment.cpp
#include "BellaError.hpp"
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

bool Environment::has(const std::string& name) const {
   if (values.find(name) != values.end()) return true;
   if (parent) return parent->has(name);
   return false;
}

bool Environment::has_own(const std::string& name) const {
   return values.find(name) != values.end();
}

void Environment::declare(const std::string& name, const Value& value, const TokenLocation& loc) {
   // Redeclaring within one frame is an error; an outer frame's binding may be shadowed.
   if (has_own(name)) {
      throw RedeclarationError("Identifier '" + name + "' has already been declared in this scope.", loc);
   }
   values.emplace(name, value);
}

void Environment::assign(const std::string& name, const Value& value, const TokenLocation& loc) {
   for (Environment* walk = this; walk; walk = walk->parent.get()) {
      auto it = walk->values.find(name);
      if (it != walk->values.end()) {
         it->second = value;
         return;
      }
   }
   throw UnboundVariableError("Cannot assign to undeclared variable '" + name + "'.", loc);
}

const Value& Environment::lookup(const std::string& name, const TokenLocation& loc) const {
   for (const Environment* walk = this; walk; walk = walk->parent.get()) {
      auto it = walk->values.find(name);
      if (it != walk->values.end()) return it->second;
   }
   throw UnboundVariableError("Undefined variable '" + name + "'.", loc);
}

EnvPtr Environment::child_frame(const EnvPtr& parent,
   const std::vector<std::pair<std::string, Value>>& bindings,
   const TokenLocation& loc) {
   auto frame = std::make_shared<Environment>(parent);
   for (const auto& [name, value] : bindings) {
      frame->declare(name, value, loc);
   }
   return frame;
}
