#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
   Parser(const std::vector < Token>& tokens);
   std::unique_ptr < ProgramNode > parse();

   private:
   std::vector < Token > tokens;
   size_t position = 0;

   Token peek() const;
   Token peek_next(size_t offset = 1) const;

   Token consume();
   bool match(TokenType t);
   Token expect(TokenType t, const std::string& errMsg);

   // expression parsing (precedence chain)
   ExprPtr parse_expression();
   ExprPtr parse_conditional();
   ExprPtr parse_logical_or();
   ExprPtr parse_logical_and();
   ExprPtr parse_equality();
   ExprPtr parse_comparison();
   ExprPtr parse_additive();
   ExprPtr parse_multiplicative();
   ExprPtr parse_unary();
   ExprPtr parse_exponent();
   ExprPtr parse_postfix();
   ExprPtr parse_primary();
   ExprPtr parse_call(const Token& calleeTok);
   ExprPtr parse_array_literal();

   // statements
   StmtPtr parse_statement();
   StmtPtr parse_variable_declaration();
   StmtPtr parse_assignment();
   StmtPtr parse_print_statement();
   StmtPtr parse_while_statement();
   StmtPtr parse_function_declaration();

   // '{' statements '}'
   BlockNode parse_block();
};
