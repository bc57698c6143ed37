#pragma once

#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer and parser)
enum class TokenType {
    // -----------------------
    // Statement keywords
    // -----------------------
    FUN,
    PRINT,
    WHILE,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    NUMBER,
    BOOLEAN,

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    OPENBRACKET,
    CLOSEBRACKET,
    COLON,
    QUESTIONMARK,

    // -----------------------
    // Declaration / assignment / file end
    // -----------------------
    WALRUS,  // :=
    ASSIGN,  // =
    EOF_TOKEN,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,
    POWER,

    // -----------------------
    // Logical
    // -----------------------
    AND,
    OR,
    NOT,

    // -----------------------
    // Comparison
    // -----------------------
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,
    EQUALITY,
    NOTEQUAL,

    UNKNOWN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<input>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in bytes

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    // Hand-built trees carry default locations with no filename.
    bool known() const { return !filename.empty(); }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw lexeme
    TokenLocation loc;  // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}
