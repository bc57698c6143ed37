#include "print_debug.hpp"

#include <string>
#include <unordered_map>

static std::string token_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::FUN, "FUN"}, {TokenType::PRINT, "PRINT"}, {TokenType::WHILE, "WHILE"},
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::NUMBER, "NUMBER"}, {TokenType::BOOLEAN, "BOOLEAN"},
        {TokenType::SEMICOLON, "SEMICOLON"}, {TokenType::COMMA, "COMMA"},
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACE, "OPENBRACE"}, {TokenType::CLOSEBRACE, "CLOSEBRACE"},
        {TokenType::OPENBRACKET, "OPENBRACKET"}, {TokenType::CLOSEBRACKET, "CLOSEBRACKET"},
        {TokenType::COLON, "COLON"}, {TokenType::QUESTIONMARK, "QUESTIONMARK"},
        {TokenType::WALRUS, "WALRUS"}, {TokenType::ASSIGN, "ASSIGN"}, {TokenType::EOF_TOKEN, "EOF_TOKEN"},
        {TokenType::PLUS, "PLUS"}, {TokenType::MINUS, "MINUS"}, {TokenType::STAR, "STAR"}, {TokenType::SLASH, "SLASH"},
        {TokenType::PERCENT, "PERCENT"}, {TokenType::POWER, "POWER"},
        {TokenType::AND, "AND"}, {TokenType::OR, "OR"}, {TokenType::NOT, "NOT"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::EQUALITY, "EQUALITY"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::UNKNOWN, "UNKNOWN"}};
    auto it = names.find(t);
    return it != names.end() ? it->second : "TOKEN(?)";
}

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "[\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        out << "  {\n";
        out << "    \"type\": \"" << token_name(tok.type) << "\",\n";
        out << "    \"value\": \"" << escape(tok.value) << "\",\n";
        out << "    \"loc\": \"" << tok.loc.to_string() << "\",\n";
        out << "    \"length\": " << tok.loc.length << "\n";
        out << "  }" << (i + 1 < tokens.size() ? "," : "") << "\n";
    }
    out << "]\n";
}

static const char* statement_kind(const Statement& stmt) {
    struct Kind {
        const char* operator()(const VariableDeclarationNode&) const { return "VariableDeclaration"; }
        const char* operator()(const AssignmentNode&) const { return "Assignment"; }
        const char* operator()(const PrintStatementNode&) const { return "PrintStatement"; }
        const char* operator()(const WhileStatementNode&) const { return "While"; }
        const char* operator()(const FunctionDeclarationNode&) const { return "FunctionDeclaration"; }
    };
    return std::visit(Kind{}, stmt.node);
}

void print_program_debug(const ProgramNode* ast, std::ostream& out, int indent) {
    if (!ast) {
        out << "{}\n";
        return;
    }

    std::string ind(indent, ' ');
    out << ind << "{\n";
    out << ind << "  \"type\": \"Program\",\n";
    out << ind << "  \"body\": [\n";

    const auto& body = ast->body.statements;
    for (size_t i = 0; i < body.size(); ++i) {
        const Statement* stmt = body[i].get();
        if (!stmt) {
            out << ind << "    null";
        } else {
            out << ind << "    {\n";
            out << ind << "      \"nodeType\": \"" << statement_kind(*stmt) << "\",\n";
            out << ind << "      \"token\": \"" << escape(stmt->token.loc.to_string()) << "\",\n";
            out << ind << "      \"source\": \"" << escape(stmt->to_string()) << "\"\n";
            out << ind << "    }";
        }
        if (i + 1 < body.size()) out << ",";
        out << "\n";
    }

    out << ind << "  ]\n";
    out << ind << "}\n";
}
