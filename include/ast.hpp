#pragma once

#include <memory>
#include <string>
#include <vector>

namespace linecalc {

// Разновидность узла синтаксического дерева.
// Валидатор пропускает только Number, Binary и Negate.
enum class NodeKind {
    Number,
    Binary,
    Negate,
    UnaryPlus
};

// Базовый класс узла абстрактного синтаксического дерева (AST).
// Дерево строится один раз, проверяется валидатором и вычисляется один раз.
class AstNode {
public:
    virtual ~AstNode() = default;

    virtual NodeKind kind() const = 0;

    // Дочерние узлы слева направо (для обхода валидатором)
    virtual std::vector<const AstNode*> children() const = 0;

    // Рекурсивно вычисляет значение поддерева.
    // Выбрасывает EvaluationError при недопустимой операции.
    virtual double evaluate() const = 0;
};

// Числовая константа (лист дерева)
class NumberNode final : public AstNode {
public:
    explicit NumberNode(double value) : value(value) {}

    NodeKind kind() const override { return NodeKind::Number; }
    std::vector<const AstNode*> children() const override { return {}; }
    double evaluate() const override { return value; }

private:
    double value; // Значение литерала
};

// Бинарная операция: + - * / % ^
class BinaryNode final : public AstNode {
public:
    BinaryNode(char op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
        : op(op), left(std::move(left)), right(std::move(right)) {}

    NodeKind kind() const override { return NodeKind::Binary; }
    std::vector<const AstNode*> children() const override;
    double evaluate() const override;

    // Символ операции, для тестов и диагностики
    char operation() const { return op; }

private:
    char op;                        // Символ операции
    std::unique_ptr<AstNode> left;  // Левый операнд
    std::unique_ptr<AstNode> right; // Правый операнд
};

// Унарный минус или плюс. Плюс разбирается, но не проходит валидацию.
class UnaryNode final : public AstNode {
public:
    UnaryNode(char op, std::unique_ptr<AstNode> child)
        : op(op), child(std::move(child)) {}

    NodeKind kind() const override;
    std::vector<const AstNode*> children() const override { return {child.get()}; }
    double evaluate() const override;

private:
    char op;                        // '-' или '+'
    std::unique_ptr<AstNode> child; // Операнд
};

} // namespace linecalc
