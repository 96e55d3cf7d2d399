#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "currency_handler.hpp"

namespace linecalc {

// Все строки файла по порядку (пустые тоже: номер строки = позиция в файле)
std::vector<std::string> readLines(const std::filesystem::path& path);

// Таблица курсов из файла: "КОД КУРС" в строке, '#' — комментарий.
// Выбрасывает std::runtime_error с номером строки при ошибке формата.
CurrencyRates loadCurrencyRates(const std::filesystem::path& path);

// Текущее время в формате для имени файла
std::string getCurrentTimeString();

} // namespace linecalc
