#pragma once

#include <optional>
#include <string>

namespace linecalc {

// Обработчик строки: пытается интерпретировать уже подготовленную строку
// и возвращает результат либо пустое значение, если строка ему не подходит.
// Реализации не должны разделять изменяемое состояние: конвейер
// может вызываться одновременно из нескольких потоков.
class Handler {
public:
    virtual ~Handler() = default;

    // Короткое имя для журналов и CSV ("math", "unit", ...)
    virtual std::string name() const = 0;

    virtual std::optional<std::string> attempt(const std::string& line) const = 0;
};

} // namespace linecalc
