#include "tree_validator.hpp"

#include "errors.hpp"

#include <utility>
#include <vector>

namespace linecalc {

namespace {
bool isWhitelisted(NodeKind kind) {
    switch (kind) {
    case NodeKind::Number:
    case NodeKind::Binary:
    case NodeKind::Negate:
        return true;
    default:
        return false;
    }
}
}

// Обход явным стеком, чтобы глубокое дерево не исчерпало стек вызовов
void TreeValidator::validate(const AstNode& root) const {
    std::vector<std::pair<const AstNode*, std::size_t>> pending;
    pending.emplace_back(&root, 1);

    while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();

        if (depth > maxDepth) {
            throw EvaluationError(ErrorKind::UnsafeStructure,
                                  "Превышена допустимая глубина выражения (" +
                                      std::to_string(maxDepth) + ")");
        }
        if (!isWhitelisted(node->kind())) {
            throw EvaluationError(ErrorKind::UnsafeStructure, "Недопустимая конструкция в выражении");
        }

        for (const AstNode* child : node->children()) {
            pending.emplace_back(child, depth + 1);
        }
    }
}

std::size_t TreeValidator::depthOf(const AstNode& root) {
    std::size_t deepest = 0;
    std::vector<std::pair<const AstNode*, std::size_t>> pending;
    pending.emplace_back(&root, 1);

    while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();
        if (depth > deepest) {
            deepest = depth;
        }
        for (const AstNode* child : node->children()) {
            pending.emplace_back(child, depth + 1);
        }
    }
    return deepest;
}

} // namespace linecalc
