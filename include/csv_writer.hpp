#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "calculator.hpp"

namespace linecalc {

// Запись результатов пакета в CSV.
// Колонки: line,input,processed,handler,result
class CsvWriter {
public:
    // Открывает файл (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    void writeRecord(const CalculationRecord& record);
    void write(const std::vector<CalculationRecord>& records);

    const std::filesystem::path& getPath() const { return path; }

private:
    std::filesystem::path path;
    std::ofstream stream;
};

// Экранирование поля по правилам RFC 4180: кавычки удваиваются,
// поле с запятой, кавычкой или переводом строки берётся в кавычки
std::string escapeCsvField(const std::string& field);

} // namespace linecalc
