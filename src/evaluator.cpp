#include "evaluator.hpp"

#include "errors.hpp"
#include "parser.hpp"
#include "text_utils.hpp"
#include "tokenizer.hpp"
#include "tree_validator.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace linecalc {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InputShape:
        return "input-shape";
    case ErrorKind::UnsafeStructure:
        return "unsafe-structure";
    case ErrorKind::NumericInvalid:
        return "numeric-invalid";
    }
    return "unknown";
}

// Полный цикл обработки выражения.
// Дерево целиком проверяется до того, как выполнится хоть одна операция.
double ExpressionEvaluator::evaluate(const std::string& expression) const {
    // Этап 1: дешёвая проверка размера до разбора
    if (expression.empty()) {
        throw EvaluationError(ErrorKind::InputShape, "Пустое выражение");
    }
    // Длина в символах, а не в байтах: ×, ÷ и − занимают по 2-3 байта
    if (countCodePoints(expression) > limits.maxLength) {
        throw EvaluationError(ErrorKind::InputShape, "Слишком длинное выражение");
    }

    // Этап 2: лексический и синтаксический анализ
    Tokenizer tokenizer(expression);
    Parser parser(tokenizer.tokenize());
    auto ast = parser.parse();

    // Этап 3: проверка структуры дерева
    TreeValidator(limits.maxDepth).validate(*ast);

    // Этап 4: вычисление
    double value = ast->evaluate();

    // Этап 5: проверка результата
    if (!isValidResult(value)) {
        throw EvaluationError(ErrorKind::NumericInvalid, "Результат вне допустимого диапазона");
    }
    return value;
}

std::optional<std::string> ExpressionEvaluator::tryEvaluate(const std::string& expression) const {
    try {
        return formatNumber(evaluate(expression));
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatNumber(double value) {
    // -0 печатаем как 0
    if (value == 0.0) {
        return "0";
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        throw EvaluationError(ErrorKind::NumericInvalid, "Не удалось отформатировать число");
    }
    return std::string(buffer, end);
}

bool isValidResult(double value) {
    if (std::isnan(value)) {
        return false;
    }
    double magnitude = std::abs(value);
    if (magnitude > std::numeric_limits<double>::max()) {
        return false;
    }
    // Денормализованные числа считаем недопустимыми
    return value == 0.0 || magnitude >= std::numeric_limits<double>::min();
}

} // namespace linecalc
