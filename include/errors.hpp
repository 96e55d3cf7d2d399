#pragma once

#include <stdexcept>
#include <string>

namespace linecalc {

// Категория отказа при вычислении выражения
enum class ErrorKind {
    InputShape,      // Пустая, слишком длинная или синтаксически неверная строка
    UnsafeStructure, // Недопустимый тип узла или превышена глубина дерева
    NumericInvalid   // Деление на ноль, слишком большой показатель, NaN, выход за диапазон
};

// Ошибка вычисления выражения. Наружу из обработчиков не выходит:
// MathHandler превращает её в пустой результат.
class EvaluationError : public std::runtime_error {
public:
    EvaluationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

// Человекочитаемое имя категории (для журналов CLI)
const char* toString(ErrorKind kind);

} // namespace linecalc
