#include "variable_handler.hpp"

#include "text_utils.hpp"

namespace linecalc {

std::optional<std::string> VariableHandler::attempt(const std::string& line) const {
    std::size_t split = line.find('=');
    if (split == std::string::npos) {
        return std::nullopt;
    }

    std::string name = trim(line.substr(0, split));
    std::string value = trim(line.substr(split + 1));
    if (!isValidIdentifier(name) || value.empty() || value.front() == '=') {
        return std::nullopt;
    }

    if (auto evaluated = evaluator.tryEvaluate(value)) {
        return evaluated;
    }
    return value;
}

} // namespace linecalc
