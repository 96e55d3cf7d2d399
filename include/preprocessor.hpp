#pragma once

#include <string>

#include "variable_store.hpp"

namespace linecalc {

// Результат предобработки одной строки
struct ProcessedLine {
    std::string text;          // Строка после подстановок
    bool isDefinition = false; // Строка была присваиванием вида "name = value"
};

// Препроцессор: распознаёт присваивания и подставляет значения переменных
// и синонимов операторов вместо отдельных слов строки.
// Каждое слово заменяется не более одного раза, слева направо.
class Preprocessor {
public:
    explicit Preprocessor(VariableStore& store) : store(store) {}

    ProcessedLine process(const std::string& rawLine);

private:
    VariableStore& store;

    // "name = expr" или "name := expr"; ':' имеет приоритет над '='
    bool tryDefinition(const std::string& line, ProcessedLine& result);

    std::string substituteReferences(const std::string& text) const;
};

} // namespace linecalc
