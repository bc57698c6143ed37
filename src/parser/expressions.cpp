// src/parser/expressions.cpp
#include <charconv>
#include <limits>

#include "BellaError.hpp"
#include "parser.hpp"

// A literal too large or too small for a double: too small when it has a
// negative exponent or no integral digits.
static bool literal_underflows(const std::string& text) {
   std::string::size_type e = text.find_first_of("eE");
   if (e != std::string::npos) return e + 1 < text.size() && text[e + 1] == '-';
   return text.rfind("0.", 0) == 0;
}

static ExprPtr make_binary(const Token& op, ExprPtr left, ExprPtr right) {
   BinaryExpressionNode node;
   node.op = op.value;
   node.left = std::move(left);
   node.right = std::move(right);
   return make_expression(std::move(node), op);
}

ExprPtr Parser::parse_expression() {
   return parse_conditional();
}

// test ? consequent : alternate  (right-associative)
ExprPtr Parser::parse_conditional() {
   auto test = parse_logical_or();

   if (peek().type != TokenType::QUESTIONMARK) {
      return test;
   }

   Token qTok = consume();  // consume '?'
   auto consequent = parse_conditional();
   expect(TokenType::COLON, "Expected ':' after conditional 'then' expression");
   auto alternate = parse_conditional();

   ConditionalExpressionNode node;
   node.test = std::move(test);
   node.consequent = std::move(consequent);
   node.alternate = std::move(alternate);
   return make_expression(std::move(node), qTok);
}

ExprPtr Parser::parse_logical_or() {
   auto left = parse_logical_and();
   while (peek().type == TokenType::OR) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_logical_and());
   }
   return left;
}

ExprPtr Parser::parse_logical_and() {
   auto left = parse_equality();
   while (peek().type == TokenType::AND) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_equality());
   }
   return left;
}

ExprPtr Parser::parse_equality() {
   auto left = parse_comparison();
   while (peek().type == TokenType::EQUALITY || peek().type == TokenType::NOTEQUAL) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_comparison());
   }
   return left;
}

ExprPtr Parser::parse_comparison() {
   auto left = parse_additive();
   while (peek().type == TokenType::LESSTHAN ||
          peek().type == TokenType::LESSOREQUALTHAN ||
          peek().type == TokenType::GREATERTHAN ||
          peek().type == TokenType::GREATEROREQUALTHAN) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_additive());
   }
   return left;
}

ExprPtr Parser::parse_additive() {
   auto left = parse_multiplicative();
   while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_multiplicative());
   }
   return left;
}

ExprPtr Parser::parse_multiplicative() {
   auto left = parse_unary();
   while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
      Token op = consume();
      left = make_binary(op, std::move(left), parse_unary());
   }
   return left;
}

// unary binds looser than '**', so -2 ** 2 is -(2 ** 2)
ExprPtr Parser::parse_unary() {
   if (peek().type == TokenType::NOT || peek().type == TokenType::MINUS) {
      Token op = consume();
      UnaryExpressionNode node;
      node.op = op.value;
      node.operand = parse_unary();
      return make_expression(std::move(node), op);
   }
   return parse_exponent();
}

ExprPtr Parser::parse_exponent() {
   // right-associative exponent
   auto left = parse_postfix();
   if (peek().type == TokenType::POWER) {
      Token op = consume();
      return make_binary(op, std::move(left), parse_unary());
   }
   return left;
}

ExprPtr Parser::parse_postfix() {
   auto node = parse_primary();
   while (peek().type == TokenType::OPENBRACKET) {
      Token bracket = consume();
      SubscriptNode sub;
      sub.array = std::move(node);
      sub.index = parse_expression();
      expect(TokenType::CLOSEBRACKET, "Expected ']' after subscript");
      node = make_expression(std::move(sub), bracket);
   }
   return node;
}

ExprPtr Parser::parse_primary() {
   Token t = peek();

   switch (t.type) {
      case TokenType::NUMBER: {
         consume();
         double value = 0.0;
         auto res = std::from_chars(t.value.data(), t.value.data() + t.value.size(), value);
         if (res.ec == std::errc::result_out_of_range) {
            // from_chars leaves `value` untouched here; pick the IEEE result
            // (1e999 -> Infinity, 1e-999 -> 0)
            value = literal_underflows(t.value) ? 0.0 : std::numeric_limits<double>::infinity();
         } else if (res.ec != std::errc() || res.ptr != t.value.data() + t.value.size()) {
            throw SyntaxError("Invalid numeric literal '" + t.value + "'.", t.loc);
         }
         return make_expression(NumeralNode{value}, t);
      }
      case TokenType::BOOLEAN:
         consume();
         return make_expression(BoolNode{t.value == "true"}, t);
      case TokenType::IDENTIFIER:
         consume();
         if (peek().type == TokenType::OPENPARENTHESIS) {
            return parse_call(t);
         }
         return make_expression(IdentifierNode{t.value}, t);
      case TokenType::OPENPARENTHESIS: {
         consume();
         auto inner = parse_expression();
         expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
         return inner;
      }
      case TokenType::OPENBRACKET:
         return parse_array_literal();
      default:
         break;
   }

   std::string found = t.type == TokenType::EOF_TOKEN ? "end of input" : "'" + t.value + "'";
   throw SyntaxError("Expected an expression, found " + found + ".", t.loc);
}

// callee already consumed; next token is '('
ExprPtr Parser::parse_call(const Token& calleeTok) {
   expect(TokenType::OPENPARENTHESIS, "Expected '(' to start call arguments");

   CallExpressionNode call;
   call.callee.name = calleeTok.value;
   if (peek().type != TokenType::CLOSEPARENTHESIS) {
      do {
         call.arguments.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after call arguments");
   return make_expression(std::move(call), calleeTok);
}

ExprPtr Parser::parse_array_literal() {
   Token open = expect(TokenType::OPENBRACKET, "Expected '['");

   ArrayLiteralNode arr;
   if (peek().type != TokenType::CLOSEBRACKET) {
      do {
         arr.elements.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEBRACKET, "Expected ']' to close array literal");
   return make_expression(std::move(arr), open);
}
