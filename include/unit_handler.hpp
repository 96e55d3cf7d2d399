#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>

#include "handler.hpp"

namespace linecalc {

// Категория физической величины
enum class UnitCategory {
    Length,
    Mass,
    Time,
    Volume,
    Data,
    Temperature
};

// Перевод единиц измерения по встроенной таблице: "1 km to m" -> "1000".
// Работает без сети; единицы разных категорий не переводятся.
class UnitHandler final : public Handler {
public:
    UnitHandler();

    std::string name() const override { return "unit"; }
    std::optional<std::string> attempt(const std::string& line) const override;

    // Перевод значения; пусто для неизвестных или несовместимых единиц
    std::optional<double> convert(double amount, const std::string& from, const std::string& to) const;

private:
    struct UnitDefinition {
        UnitCategory category;
        double factor; // Множитель к базовой единице категории
    };

    std::unordered_map<std::string, UnitDefinition> units;

    void addUnit(UnitCategory category, double factor, std::initializer_list<const char*> names);
    std::optional<UnitDefinition> find(const std::string& unit) const;
};

} // namespace linecalc
