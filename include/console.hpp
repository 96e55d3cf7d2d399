#pragma once

#include <iostream>
#include <string>

#include "calculator.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Сообщение об ошибке в std::cerr
void printError(const std::string& message);

// Строка результата: "выражение = результат" (строки без результата пропускаются,
// в подробном режиме печатаются сбои обработчиков)
void printRecord(const linecalc::CalculationRecord& record, bool verbose);
