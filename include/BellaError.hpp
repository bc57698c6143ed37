#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Every failure the front-end or the evaluator reports. None of them is
// recoverable from inside a Bella program; they all unwind to the driver.
class BellaError : public std::runtime_error {
   public:
    BellaError(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(type, message, loc)),
                                    type_(type),
                                    detail_(message),
                                    loc_(loc) {}

    const std::string& type() const { return type_; }
    const std::string& detail() const { return detail_; }
    const TokenLocation& location() const { return loc_; }

   private:
    std::string type_;
    std::string detail_;
    TokenLocation loc_;

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        if (!loc.known()) return type + ": " + message;
        return type + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

// Lexical or grammatical error in the source text.
class SyntaxError : public BellaError {
   public:
    SyntaxError(const std::string& message, const TokenLocation& loc)
        : BellaError("SyntaxError", message, loc) {}
};

// A name declared twice in one frame.
class RedeclarationError : public BellaError {
   public:
    RedeclarationError(const std::string& message, const TokenLocation& loc)
        : BellaError("RedeclarationError", message, loc) {}
};

// Lookup or assignment of a name no frame binds.
class UnboundVariableError : public BellaError {
   public:
    UnboundVariableError(const std::string& message, const TokenLocation& loc)
        : BellaError("UnboundVariableError", message, loc) {}
};

// An operator or construct applied to the wrong kind of value.
class TypeError : public BellaError {
   public:
    TypeError(const std::string& message, const TokenLocation& loc)
        : BellaError("TypeError", message, loc) {}
};

class UnknownOperatorError : public BellaError {
   public:
    UnknownOperatorError(const std::string& message, const TokenLocation& loc)
        : BellaError("UnknownOperatorError", message, loc) {}
};

class NotCallableError : public BellaError {
   public:
    NotCallableError(const std::string& message, const TokenLocation& loc)
        : BellaError("NotCallableError", message, loc) {}
};

// Argument count differs from the callee's parameter count.
class ArityMismatchError : public BellaError {
   public:
    ArityMismatchError(const std::string& message, const TokenLocation& loc)
        : BellaError("ArityMismatchError", message, loc) {}
};

class IndexOutOfRangeError : public BellaError {
   public:
    IndexOutOfRangeError(const std::string& message, const TokenLocation& loc)
        : BellaError("IndexOutOfRangeError", message, loc) {}
};

// Call nesting exhausted the native stack budget.
class StackOverflowError : public BellaError {
   public:
    StackOverflowError(const std::string& message, const TokenLocation& loc)
        : BellaError("StackOverflowError", message, loc) {}
};

// A closure whose defining scope is gone.
class RuntimeError : public BellaError {
   public:
    RuntimeError(const std::string& message, const TokenLocation& loc)
        : BellaError("RuntimeError", message, loc) {}
};
