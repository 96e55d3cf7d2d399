#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>

namespace linecalc {

namespace {
// Юникодные синонимы операторов
constexpr std::string_view kTimesGlyph = "\xC3\x97";      // ×
constexpr std::string_view kDivideGlyph = "\xC3\xB7";     // ÷
constexpr std::string_view kMinusGlyph = "\xE2\x88\x92";  // −
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        const std::size_t start = index;
        char ch = peek();
        switch (ch) {
        case '+':
            tokens.push_back({TokenType::Plus, 0.0, "+", start});
            advance();
            break;
        case '-':
            tokens.push_back({TokenType::Minus, 0.0, "-", start});
            advance();
            break;
        case '*':
            tokens.push_back({TokenType::Star, 0.0, "*", start});
            advance();
            break;
        case '/':
            tokens.push_back({TokenType::Slash, 0.0, "/", start});
            advance();
            break;
        case '%':
            tokens.push_back({TokenType::Percent, 0.0, "%", start});
            advance();
            break;
        case '^':
            tokens.push_back({TokenType::Caret, 0.0, "^", start});
            advance();
            break;
        case '(':
            tokens.push_back({TokenType::LParen, 0.0, "(", start});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, 0.0, ")", start});
            advance();
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '.') {
                tokens.push_back(makeNumber());
            } else if (matchGlyph(kTimesGlyph)) {
                tokens.push_back({TokenType::Star, 0.0, "*", start});
            } else if (matchGlyph(kDivideGlyph)) {
                tokens.push_back({TokenType::Slash, 0.0, "/", start});
            } else if (matchGlyph(kMinusGlyph)) {
                tokens.push_back({TokenType::Minus, 0.0, "-", start});
            } else {
                throw EvaluationError(ErrorKind::InputShape,
                                      "Недопустимый символ в позиции " + std::to_string(index));
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0.0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

bool Tokenizer::matchGlyph(std::string_view glyph) {
    if (source.compare(index, glyph.size(), glyph) != 0) {
        return false;
    }
    index += glyph.size();
    return true;
}

// Поддерживает записи вида 12, 3.5, .5 и 5.
// Экспоненциальная запись не поддерживается
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    bool hasDot = false;
    bool hasDigit = false;
    while (!isAtEnd()) {
        char ch = peek();
        if (ch == '.') {
            if (hasDot) {
                break; // Вторая точка — конец числа
            }
            hasDot = true;
            advance();
        } else if (std::isdigit(static_cast<unsigned char>(ch))) {
            hasDigit = true;
            advance();
        } else {
            break;
        }
    }

    std::string text = source.substr(start, index - start);
    if (!hasDigit) {
        throw EvaluationError(ErrorKind::InputShape,
                              "Некорректное число в позиции " + std::to_string(start));
    }

    // std::stod бросает out_of_range на литералах вне диапазона double
    double value = 0.0;
    try {
        value = std::stod(text);
    } catch (const std::out_of_range&) {
        throw EvaluationError(ErrorKind::NumericInvalid,
                              "Число вне допустимого диапазона в позиции " + std::to_string(start));
    }
    return {TokenType::Number, value, text, start};
}

} // namespace linecalc
