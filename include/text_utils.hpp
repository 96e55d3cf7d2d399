#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace linecalc {

// Удаление пробельных символов по краям строки
std::string trim(std::string_view text);

// Приведение ASCII-букв к нижнему регистру
std::string toLower(std::string_view text);

// Разбиение по пробельным символам, пустые фрагменты отбрасываются
std::vector<std::string> splitWhitespace(std::string_view text);

// Склейка через один пробел
std::string joinWithSpaces(const std::vector<std::string>& parts);

// Число символов UTF-8: продолжающие байты 0x80..0xBF не считаются
std::size_t countCodePoints(std::string_view text);

// Имя переменной: непустое, только буквы и цифры ASCII, первая — буква
bool isValidIdentifier(std::string_view name);

} // namespace linecalc
