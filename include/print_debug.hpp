#pragma once
#include <ostream>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

void print_tokens(const std::vector<Token>& tokens, std::ostream& out);

void print_program_debug(const ProgramNode* ast, std::ostream& out, int indent = 0);
