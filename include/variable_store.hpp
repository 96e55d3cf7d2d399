#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace linecalc {

// Происхождение записи в хранилище
enum class VariableOrigin {
    Operator, // Засеяна из таблицы синонимов операторов
    User      // Определена пользователем через присваивание
};

// Хранилище переменных: имя в нижнем регистре -> текстовое значение.
// При создании заполняется синонимами операторов (plus -> +, ...).
// Каждая операция выполняется под одним мьютексом.
class VariableStore {
public:
    VariableStore();

    VariableStore(const VariableStore&) = delete;
    VariableStore& operator=(const VariableStore&) = delete;

    // Сохраняет значение под именем в нижнем регистре.
    // Возвращает false и ничего не меняет, если имя недопустимо.
    bool define(const std::string& name, const std::string& value);

    // Точный поиск без учёта регистра
    std::optional<std::string> lookup(const std::string& name) const;

    // Удаляет пользовательские переменные. Синонимы операторов остаются,
    // в том числе те, что пользователь успел переопределить.
    void resetUserVariables();

    bool contains(const std::string& name) const;
    std::size_t size() const;

    // Происхождение записи, если она есть
    std::optional<VariableOrigin> originOf(const std::string& name) const;

private:
    struct Entry {
        std::string value;
        VariableOrigin origin;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;

    // Вызывается под захваченным мьютексом
    void seedOperators();
};

} // namespace linecalc
