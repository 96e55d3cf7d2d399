#pragma once

#include <cstddef>

#include "ast.hpp"

namespace linecalc {

// Проверка дерева перед вычислением: разрешены только числа, бинарные
// операции и унарный минус, глубина не больше maxDepth (корень на глубине 1).
class TreeValidator {
public:
    explicit TreeValidator(std::size_t maxDepth) : maxDepth(maxDepth) {}

    // Выбрасывает EvaluationError(UnsafeStructure), если дерево недопустимо
    void validate(const AstNode& root) const;

    // Глубина дерева без проверок (для диагностики и тестов)
    static std::size_t depthOf(const AstNode& root);

private:
    std::size_t maxDepth;
};

} // namespace linecalc
