// src/parser/parser.cpp
#include "parser.hpp"

#include "BellaError.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token or EOF token
Token Parser::consume() {
    if (position < tokens.size()) return tokens[position++];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        Token tok = peek();
        std::string found = tok.type == TokenType::EOF_TOKEN ? "end of input" : "'" + tok.value + "'";
        throw SyntaxError(errMsg + " (found " + found + ").", tok.loc);
    }
    return consume();
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    while (peek().type != TokenType::EOF_TOKEN) {
        if (match(TokenType::SEMICOLON)) continue;
        program->body.statements.push_back(parse_statement());
    }
    return program;
}
