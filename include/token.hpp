#pragma once

#include <cstddef>
#include <string>

namespace linecalc {

// Типы токенов арифметической грамматики
enum class TokenType {
    Number,  // Числовой литерал
    Plus,    // +
    Minus,   // - или −
    Star,    // * или ×
    Slash,   // / или ÷
    Percent, // %
    Caret,   // ^
    LParen,  // (
    RParen,  // )
    End      // Конец входа
};

// Лексема с позицией в исходной строке (в байтах)
struct Token {
    TokenType type;
    double numericValue;
    std::string text;
    std::size_t position;
};

} // namespace linecalc
