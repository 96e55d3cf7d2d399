#include "pipeline.hpp"

#include <stdexcept>

namespace linecalc {

DispatchPipeline::DispatchPipeline(std::vector<std::unique_ptr<Handler>> handlers)
    : handlers(std::move(handlers)) {
    for (const auto& handler : this->handlers) {
        if (!handler) {
            throw std::invalid_argument("Пустой обработчик в конвейере");
        }
    }
}

std::optional<std::string> DispatchPipeline::run(const std::string& line) const {
    return dispatch(line).result;
}

DispatchOutcome DispatchPipeline::dispatch(const std::string& line) const {
    DispatchOutcome outcome;
    if (line.empty()) {
        return outcome;
    }

    for (const auto& handler : handlers) {
        std::optional<std::string> answer;
        try {
            answer = handler->attempt(line);
        }
        catch (const std::exception& ex) {
            // Сбой одного обработчика не прерывает строку: переходим к следующему
            outcome.faults.push_back(handler->name() + ": " + ex.what());
            continue;
        }
        catch (...) {
            // Исключение не из иерархии std::exception: тоже считаем отказом
            outcome.faults.push_back(handler->name() + ": неизвестный сбой");
            continue;
        }

        if (answer && !answer->empty()) {
            outcome.result = std::move(answer);
            outcome.handlerName = handler->name();
            break;
        }
    }
    return outcome;
}

std::vector<std::string> DispatchPipeline::handlerNames() const {
    std::vector<std::string> names;
    names.reserve(handlers.size());
    for (const auto& handler : handlers) {
        names.push_back(handler->name());
    }
    return names;
}

} // namespace linecalc
