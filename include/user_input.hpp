#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linecalc {

// Режим работы программы
enum class RunMode {
    Interactive, // Построчный ввод с консоли (по умолчанию)
    Expression,  // Одно выражение из -e
    Files,       // Пакетная обработка файлов из -f
    Help
};

// Параметры командной строки
struct CliOptions {
    RunMode mode = RunMode::Interactive;
    std::string expression;
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> outputPath; // -o, только для одного файла
    bool csvBesideInput = false;                     // -c: CSV рядом с каждым входным файлом
    std::size_t threadCount = 0;                     // 0 — по числу ядер
    std::optional<std::filesystem::path> ratesPath;
    bool verbose = false;
};

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Разбор argv. Выбрасывает std::runtime_error при неизвестном ключе
// или отсутствующем значении.
CliOptions parseArguments(const std::vector<std::string>& arguments);

// Число потоков по умолчанию
std::size_t defaultThreadCount();

// Текст справки
std::string usageText(const std::string& programName);

} // namespace linecalc
