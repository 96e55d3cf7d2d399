#include "math_handler.hpp"

namespace linecalc {

std::optional<std::string> MathHandler::attempt(const std::string& line) const {
    return evaluator.tryEvaluate(line);
}

} // namespace linecalc
