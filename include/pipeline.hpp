#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "handler.hpp"

namespace linecalc {

// Подробный итог диспетчеризации одной строки
struct DispatchOutcome {
    std::optional<std::string> result;
    std::string handlerName;          // Кто ответил; пусто, если никто
    std::vector<std::string> faults;  // "имя: сообщение" для упавших обработчиков
};

// Упорядоченный список обработчиков. Порядок — часть контракта:
// первый непустой ответ побеждает, остальные обработчики не вызываются.
class DispatchPipeline {
public:
    explicit DispatchPipeline(std::vector<std::unique_ptr<Handler>> handlers);

    // Результат первого согласившегося обработчика или пусто.
    // Пустая строка не передаётся ни одному обработчику.
    std::optional<std::string> run(const std::string& line) const;

    // То же, что run, плюс имя ответившего обработчика и перехваченные сбои
    DispatchOutcome dispatch(const std::string& line) const;

    std::vector<std::string> handlerNames() const;

private:
    std::vector<std::unique_ptr<Handler>> handlers;
};

} // namespace linecalc
