#include "csv_writer.hpp"

#include <stdexcept>

namespace linecalc {

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,input,processed,handler,result\n";
}

void CsvWriter::writeRecord(const CalculationRecord& record) {
    stream << record.lineNumber << ','
           << escapeCsvField(record.input) << ','
           << escapeCsvField(record.processed) << ','
           << escapeCsvField(record.handler) << ',';
    if (record.result) {
        stream << escapeCsvField(*record.result);
    }
    stream << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV: " + path.string());
    }
}

void CsvWriter::write(const std::vector<CalculationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    stream.flush();
}

std::string escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char ch : field) {
        if (ch == '"') {
            escaped += '"';
        }
        escaped += ch;
    }
    escaped += '"';
    return escaped;
}

} // namespace linecalc
