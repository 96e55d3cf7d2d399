#include "preprocessor.hpp"

#include "text_utils.hpp"

namespace linecalc {

ProcessedLine Preprocessor::process(const std::string& rawLine) {
    ProcessedLine result;
    std::string line = trim(rawLine);
    if (line.empty()) {
        return result;
    }

    if (!tryDefinition(line, result)) {
        result.text = substituteReferences(line);
    }
    return result;
}

bool Preprocessor::tryDefinition(const std::string& line, ProcessedLine& result) {
    std::size_t split = line.find(':');
    const bool colonForm = split != std::string::npos;
    if (!colonForm) {
        split = line.find('=');
    }
    if (split == std::string::npos) {
        return false;
    }

    std::string name = trim(line.substr(0, split));
    std::string value = trim(line.substr(split + 1));
    // "name := expr": знак '=' после двоеточия относится к оператору присваивания
    if (colonForm && !value.empty() && value.front() == '=') {
        value = trim(value.substr(1));
    }

    if (!isValidIdentifier(name)) {
        return false;
    }

    std::string substituted = substituteReferences(value);
    if (!store.define(name, substituted)) {
        return false;
    }

    result.text = name + " = " + substituted;
    result.isDefinition = true;
    return true;
}

std::string Preprocessor::substituteReferences(const std::string& text) const {
    std::vector<std::string> tokens = splitWhitespace(text);
    for (auto& token : tokens) {
        if (auto value = store.lookup(token)) {
            token = *value;
        }
    }
    return joinWithSpaces(tokens);
}

} // namespace linecalc
