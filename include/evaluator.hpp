#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace linecalc {

// Ограничения безопасного вычислителя
struct EvaluatorLimits {
    std::size_t maxLength = 1000; // Максимальная длина выражения в символах UTF-8
    std::size_t maxDepth = 20;    // Максимальная глубина AST
};

// Класс-фасад безопасного вычисления арифметических выражений.
// Этапы: проверка длины -> токенизация -> парсинг -> проверка дерева ->
// вычисление -> проверка результата. Не хранит состояния между вызовами,
// поэтому один экземпляр можно использовать из нескольких потоков.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;
    explicit ExpressionEvaluator(EvaluatorLimits limits) : limits(limits) {}

    // Пример: "2 + 2 * 2" -> 6.0
    // Выбрасывает EvaluationError, если строку нельзя безопасно вычислить.
    double evaluate(const std::string& expression) const;

    // То же, но без исключений: отформатированный результат или пусто
    std::optional<std::string> tryEvaluate(const std::string& expression) const;

    const EvaluatorLimits& getLimits() const { return limits; }

private:
    EvaluatorLimits limits;
};

// Кратчайшее представление числа, читаемое обратно без потерь: 4, 2.5, 1e+100
std::string formatNumber(double value);

// Проверка итогового результата: не NaN, |x| <= DBL_MAX, |x| >= DBL_MIN либо ноль
bool isValidResult(double value);

} // namespace linecalc
