#pragma once

#include <memory>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace linecalc {

// Синтаксический анализатор (рекурсивный спуск).
// Приоритеты от низкого к высокому: + - ; * / % ; ^ (правоассоциативная) ; унарный минус.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Возвращает корень AST, выбрасывает EvaluationError при синтаксической ошибке
    std::unique_ptr<AstNode> parse();

private:
    const std::vector<Token> tokens;
    std::size_t current = 0;

    const Token& peek() const;
    bool match(TokenType type);
    const Token& consume(TokenType type, const std::string& errorMessage);
    bool isAtEnd() const;

    // Expression -> Term { ("+" | "-") Term }
    std::unique_ptr<AstNode> parseExpression();

    // Term -> Factor { ("*" | "/" | "%") Factor }
    std::unique_ptr<AstNode> parseTerm();

    // Factor -> Unary [ "^" Factor ]
    std::unique_ptr<AstNode> parseFactor();

    // Unary -> ("-" | "+") Unary | Primary
    std::unique_ptr<AstNode> parseUnary();

    // Primary -> Number | "(" Expression ")"
    std::unique_ptr<AstNode> parsePrimary();
};

} // namespace linecalc
