#include "ast.hpp"

#include "errors.hpp"

#include <cmath>

namespace linecalc {

namespace {
// Наибольший допустимый модуль показателя степени
constexpr double kMaxExponent = 100.0;

// Промежуточный результат обязан оставаться конечным числом
double checked(double value, const char* operation) {
    if (!std::isfinite(value)) {
        throw EvaluationError(ErrorKind::NumericInvalid,
                              std::string("Переполнение или NaN в операции ") + operation);
    }
    return value;
}
}

std::vector<const AstNode*> BinaryNode::children() const {
    return {left.get(), right.get()};
}

// Сначала оба операнда, затем сама операция с проверкой результата
double BinaryNode::evaluate() const {
    double leftValue = left->evaluate();
    double rightValue = right->evaluate();

    switch (op) {
    case '+':
        return checked(leftValue + rightValue, "+");
    case '-':
        return checked(leftValue - rightValue, "-");
    case '*':
        return checked(leftValue * rightValue, "*");
    case '/':
        // Ноль в знаменателе запрещён даже там, где IEEE дал бы бесконечность
        if (rightValue == 0.0) {
            throw EvaluationError(ErrorKind::NumericInvalid, "Деление на ноль");
        }
        return checked(leftValue / rightValue, "/");
    case '%':
        // Остаток со знаком делимого, как у std::fmod
        if (rightValue == 0.0) {
            throw EvaluationError(ErrorKind::NumericInvalid, "Остаток от деления на ноль");
        }
        return checked(std::fmod(leftValue, rightValue), "%");
    case '^':
        // Ограничение показателя отсекает 9999 ^ 9999 до вызова pow
        if (std::abs(rightValue) > kMaxExponent) {
            throw EvaluationError(ErrorKind::NumericInvalid, "Слишком большой показатель степени");
        }
        return checked(std::pow(leftValue, rightValue), "^");
    default:
        throw EvaluationError(ErrorKind::UnsafeStructure, "Неизвестная бинарная операция");
    }
}

NodeKind UnaryNode::kind() const {
    return op == '-' ? NodeKind::Negate : NodeKind::UnaryPlus;
}

// Унарный плюс сюда не доходит: валидатор отклоняет его раньше
double UnaryNode::evaluate() const {
    double childValue = child->evaluate();
    switch (op) {
    case '-':
        return -childValue;
    default:
        throw EvaluationError(ErrorKind::UnsafeStructure, "Недопустимая унарная операция");
    }
}

} // namespace linecalc
