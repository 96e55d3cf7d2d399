#include "parser.hpp"

#include "errors.hpp"

namespace linecalc {

namespace {
[[noreturn]] void syntaxError(const std::string& message) {
    throw EvaluationError(ErrorKind::InputShape, message);
}
}

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

// Всё выражение должно быть разобрано без остатка
std::unique_ptr<AstNode> Parser::parse() {
    auto exprNode = parseExpression();
    if (!isAtEnd()) {
        syntaxError("Неожиданный хвост выражения возле позиции " +
                    std::to_string(peek().position));
    }
    return exprNode;
}

// Текущий токен без сдвига; End всегда последний, выхода за границу нет
const Token& Parser::peek() const {
    return tokens[current];
}

// Сдвигается, только если тип совпал
bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& errorMessage) {
    if (match(type)) {
        return tokens[current - 1];
    }
    syntaxError(errorMessage);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
std::unique_ptr<AstNode> Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        if (match(TokenType::Plus)) {
            auto right = parseTerm();
            node = std::make_unique<BinaryNode>('+', std::move(node), std::move(right));
        } else if (match(TokenType::Minus)) {
            auto right = parseTerm();
            node = std::make_unique<BinaryNode>('-', std::move(node), std::move(right));
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Term -> Factor { ("*" | "/" | "%") Factor }
std::unique_ptr<AstNode> Parser::parseTerm() {
    auto node = parseFactor();
    while (true) {
        char op = 0;
        if (match(TokenType::Star)) {
            op = '*';
        } else if (match(TokenType::Slash)) {
            op = '/';
        } else if (match(TokenType::Percent)) {
            op = '%';
        } else {
            break;
        }
        auto right = parseFactor();
        node = std::make_unique<BinaryNode>(op, std::move(node), std::move(right));
    }
    return node;
}

// Грамматика: Factor -> Unary [ "^" Factor ]
// Правая ассоциативность: 2 ^ 3 ^ 2 == 2 ^ (3 ^ 2)
std::unique_ptr<AstNode> Parser::parseFactor() {
    auto base = parseUnary();
    if (match(TokenType::Caret)) {
        auto exponent = parseFactor();
        return std::make_unique<BinaryNode>('^', std::move(base), std::move(exponent));
    }
    return base;
}

// Грамматика: Unary -> ("+" | "-") Unary | Primary
// Унарный знак связывает сильнее "^": -2 ^ 2 == 4
std::unique_ptr<AstNode> Parser::parseUnary() {
    if (match(TokenType::Minus)) {
        return std::make_unique<UnaryNode>('-', parseUnary());
    }
    if (match(TokenType::Plus)) {
        return std::make_unique<UnaryNode>('+', parseUnary());
    }
    return parsePrimary();
}

// Грамматика: Primary -> Number | "(" Expression ")"
std::unique_ptr<AstNode> Parser::parsePrimary() {
    // Число
    if (match(TokenType::Number)) {
        const auto& token = tokens[current - 1];
        return std::make_unique<NumberNode>(token.numericValue);
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        auto node = parseExpression();
        consume(TokenType::RParen, "Ожидалась закрывающая скобка");
        return node;
    }

    syntaxError("Неожиданный токен возле позиции " + std::to_string(peek().position));
}

} // namespace linecalc
