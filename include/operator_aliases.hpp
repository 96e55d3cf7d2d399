#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linecalc {

// Канонический оператор и его словесные синонимы
struct AliasEntry {
    std::string canonical;            // +, -, *, /, % или ^
    std::vector<std::string> aliases; // В нижнем регистре
};

// Статическая таблица синонимов операторов (только для чтения)
const std::vector<AliasEntry>& operatorAliases();

// Канонический оператор для символа или синонима, регистр не важен.
// Сам канонический символ тоже распознаётся: canonicalOf("+") == "+".
std::optional<std::string> canonicalOf(std::string_view token);

// Является ли текст одним из канонических операторов
bool isCanonicalOperator(std::string_view text);

} // namespace linecalc
