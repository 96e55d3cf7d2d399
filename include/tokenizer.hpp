#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "token.hpp"

namespace linecalc {

// Лексический анализатор арифметического выражения.
// Понимает числа, скобки и операторы + - * / % ^, а также
// символы × ÷ − в кодировке UTF-8. Любой другой символ (в том числе буквы)
// считается ошибкой: идентификаторы к этому моменту уже подставлены препроцессором.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Возвращает вектор токенов, заканчивающийся токеном End.
    // Выбрасывает EvaluationError при недопустимом символе или кривом числе.
    std::vector<Token> tokenize();

private:
    const std::string source;
    std::size_t index = 0;

    bool isAtEnd() const;
    char peek() const;
    char advance();
    void skipWhitespace();

    // Пытается распознать многобайтовый оператор (×, ÷, −) в текущей позиции
    bool matchGlyph(std::string_view glyph);

    // Считывает число (целое или с плавающей точкой)
    Token makeNumber();
};

} // namespace linecalc
