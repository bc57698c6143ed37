#include "lexer.hpp"

#include <cctype>
#include <unordered_map>

#include "BellaError.hpp"

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {
}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, len, src_mgr);
    out.push_back(Token{type, value, loc});
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

static bool is_ident_start(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    // any byte of a multi-byte UTF-8 sequence counts, so names like π work
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

static bool is_ident_part(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

// digits [ '.' digits ] [ (e|E) [+|-] digits ]
void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();

    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    if (peek() == 'e' || peek() == 'E') {
        size_t digits_at = (peek_next() == '+' || peek_next() == '-') ? 2 : 1;
        if (std::isdigit(static_cast<unsigned char>(peek(digits_at)))) {
            for (size_t k = 0; k < digits_at; ++k) advance();
            while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
        }
    }

    add_token(out, TokenType::NUMBER, src.substr(start_index, i - start_index), tok_line, tok_col);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (!eof() && is_ident_part(peek())) advance();
    std::string word = src.substr(start_index, i - start_index);

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"fun", TokenType::FUN},
        {"print", TokenType::PRINT},
        {"while", TokenType::WHILE},
        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},
    };

    auto it = keywords.find(word);
    add_token(out, it != keywords.end() ? it->second : TokenType::IDENTIFIER, word, tok_line, tok_col);
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start = i;

    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    if (c == '/' && peek_next() == '/') {
        skip_line_comment();
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start);
        return;
    }

    if (is_ident_start(c)) {
        scan_identifier_or_keyword(out, tok_line, tok_col, start);
        return;
    }

    // two-character operators first
    static const std::unordered_map<std::string, TokenType> doubles = {
        {":=", TokenType::WALRUS},
        {"**", TokenType::POWER},
        {"<=", TokenType::LESSOREQUALTHAN},
        {">=", TokenType::GREATEROREQUALTHAN},
        {"==", TokenType::EQUALITY},
        {"!=", TokenType::NOTEQUAL},
        {"&&", TokenType::AND},
        {"||", TokenType::OR},
    };
    std::string two{c, peek_next()};
    auto dit = doubles.find(two);
    if (dit != doubles.end()) {
        advance();
        advance();
        add_token(out, dit->second, two, tok_line, tok_col);
        return;
    }

    TokenType type = TokenType::UNKNOWN;
    switch (c) {
        case '=': type = TokenType::ASSIGN; break;
        case '+': type = TokenType::PLUS; break;
        case '-': type = TokenType::MINUS; break;
        case '*': type = TokenType::STAR; break;
        case '/': type = TokenType::SLASH; break;
        case '%': type = TokenType::PERCENT; break;
        case '<': type = TokenType::LESSTHAN; break;
        case '>': type = TokenType::GREATERTHAN; break;
        case '!': type = TokenType::NOT; break;
        case '?': type = TokenType::QUESTIONMARK; break;
        case ':': type = TokenType::COLON; break;
        case ',': type = TokenType::COMMA; break;
        case ';': type = TokenType::SEMICOLON; break;
        case '(': type = TokenType::OPENPARENTHESIS; break;
        case ')': type = TokenType::CLOSEPARENTHESIS; break;
        case '{': type = TokenType::OPENBRACE; break;
        case '}': type = TokenType::CLOSEBRACE; break;
        case '[': type = TokenType::OPENBRACKET; break;
        case ']': type = TokenType::CLOSEBRACKET; break;
        default: break;
    }

    if (type == TokenType::UNKNOWN) {
        TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, 1, src_mgr);
        throw SyntaxError("Unexpected character '" + std::string(1, c) + "'.", loc);
    }

    advance();
    add_token(out, type, std::string(1, c), tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (!eof()) {
        scan_token(out);
    }
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);
    return out;
}
