// src/parser/statements.cpp
#include "BellaError.hpp"
#include "parser.hpp"

StmtPtr Parser::parse_statement() {
   Token t = peek();

   switch (t.type) {
      case TokenType::FUN:
         return parse_function_declaration();
      case TokenType::PRINT:
         return parse_print_statement();
      case TokenType::WHILE:
         return parse_while_statement();
      case TokenType::IDENTIFIER:
         if (peek_next().type == TokenType::WALRUS) return parse_variable_declaration();
         if (peek_next().type == TokenType::ASSIGN) return parse_assignment();
         throw SyntaxError("Expected ':=' or '=' after '" + t.value + "'.", peek_next().loc);
      default:
         break;
   }

   std::string found = t.type == TokenType::EOF_TOKEN ? "end of input" : "'" + t.value + "'";
   throw SyntaxError("Expected a statement, found " + found + ".", t.loc);
}

// name := expression
StmtPtr Parser::parse_variable_declaration() {
   Token idTok = expect(TokenType::IDENTIFIER, "Expected variable name");
   expect(TokenType::WALRUS, "Expected ':=' in declaration");

   VariableDeclarationNode node;
   node.id.name = idTok.value;
   node.initializer = parse_expression();
   return make_statement(std::move(node), idTok);
}

// name = expression
StmtPtr Parser::parse_assignment() {
   Token idTok = expect(TokenType::IDENTIFIER, "Expected assignment target");
   expect(TokenType::ASSIGN, "Expected '=' in assignment");

   AssignmentNode node;
   node.target.name = idTok.value;
   node.source = parse_expression();
   return make_statement(std::move(node), idTok);
}

// print expression  (the usual spelling is print(expression))
StmtPtr Parser::parse_print_statement() {
   Token printTok = expect(TokenType::PRINT, "Expected 'print'");

   PrintStatementNode node;
   node.expression = parse_expression();
   return make_statement(std::move(node), printTok);
}

// while condition { statements }
StmtPtr Parser::parse_while_statement() {
   Token whileTok = expect(TokenType::WHILE, "Expected 'while'");

   WhileStatementNode node;
   node.condition = parse_expression();
   node.body = parse_block();
   return make_statement(std::move(node), whileTok);
}

// fun name(a, b, ...) = expression
StmtPtr Parser::parse_function_declaration() {
   expect(TokenType::FUN, "Expected 'fun'");
   Token nameTok = expect(TokenType::IDENTIFIER, "Expected function name after 'fun'");

   FunctionDeclarationNode node;
   node.name.name = nameTok.value;

   expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name");
   if (peek().type != TokenType::CLOSEPARENTHESIS) {
      do {
         Token p = expect(TokenType::IDENTIFIER, "Expected parameter name");
         for (const auto& existing : node.parameters) {
            if (existing.name == p.value) {
               throw SyntaxError("Duplicate parameter '" + p.value + "' in function '" + nameTok.value + "'.", p.loc);
            }
         }
         node.parameters.push_back(IdentifierNode{p.value});
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameters");
   expect(TokenType::ASSIGN, "Expected '=' before function body");

   node.body = parse_expression();
   return make_statement(std::move(node), nameTok);
}

BlockNode Parser::parse_block() {
   expect(TokenType::OPENBRACE, "Expected '{' to start block");

   BlockNode block;
   while (peek().type != TokenType::CLOSEBRACE) {
      if (peek().type == TokenType::EOF_TOKEN) {
         throw SyntaxError("Unterminated block: expected '}'.", peek().loc);
      }
      if (match(TokenType::SEMICOLON)) continue;
      block.statements.push_back(parse_statement());
   }
   expect(TokenType::CLOSEBRACE, "Expected '}' to close block");
   return block;
}
