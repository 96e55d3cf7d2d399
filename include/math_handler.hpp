#pragma once

#include "evaluator.hpp"
#include "handler.hpp"

namespace linecalc {

// Арифметика через безопасный вычислитель
class MathHandler final : public Handler {
public:
    MathHandler() = default;
    explicit MathHandler(EvaluatorLimits limits) : evaluator(limits) {}

    std::string name() const override { return "math"; }
    std::optional<std::string> attempt(const std::string& line) const override;

private:
    ExpressionEvaluator evaluator;
};

} // namespace linecalc
