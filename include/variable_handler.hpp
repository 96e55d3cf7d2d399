#pragma once

#include "evaluator.hpp"
#include "handler.hpp"

namespace linecalc {

// Отвечает на строки-присваивания вида "name = value", которые
// подготовил препроцессор: результатом будет значение переменной,
// вычисленное, если это арифметика, иначе сам текст значения.
class VariableHandler final : public Handler {
public:
    VariableHandler() = default;
    explicit VariableHandler(EvaluatorLimits limits) : evaluator(limits) {}

    std::string name() const override { return "variable"; }
    std::optional<std::string> attempt(const std::string& line) const override;

private:
    ExpressionEvaluator evaluator;
};

} // namespace linecalc
