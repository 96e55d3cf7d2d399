#include "unit_handler.hpp"

#include "conversion_query.hpp"
#include "evaluator.hpp"

namespace linecalc {

namespace {
constexpr int kSignificantDigits = 12;

// Температура: factor хранит код шкалы
constexpr double kCelsius = 0.0;
constexpr double kFahrenheit = 1.0;
constexpr double kKelvin = 2.0;

double toCelsius(double value, double scale) {
    if (scale == kFahrenheit) {
        return (value - 32.0) * 5.0 / 9.0;
    }
    if (scale == kKelvin) {
        return value - 273.15;
    }
    return value;
}

double fromCelsius(double value, double scale) {
    if (scale == kFahrenheit) {
        return value * 9.0 / 5.0 + 32.0;
    }
    if (scale == kKelvin) {
        return value + 273.15;
    }
    return value;
}
}

UnitHandler::UnitHandler() {
    // Длина, база — метр
    addUnit(UnitCategory::Length, 0.001, {"mm", "millimeter", "millimeters", "millimetre", "millimetres"});
    addUnit(UnitCategory::Length, 0.01, {"cm", "centimeter", "centimeters", "centimetre", "centimetres"});
    addUnit(UnitCategory::Length, 1.0, {"m", "meter", "meters", "metre", "metres"});
    addUnit(UnitCategory::Length, 1000.0, {"km", "kilometer", "kilometers", "kilometre", "kilometres"});
    addUnit(UnitCategory::Length, 0.0254, {"in", "inch", "inches"});
    addUnit(UnitCategory::Length, 0.3048, {"ft", "foot", "feet"});
    addUnit(UnitCategory::Length, 0.9144, {"yd", "yard", "yards"});
    addUnit(UnitCategory::Length, 1609.344, {"mi", "mile", "miles"});

    // Масса, база — килограмм
    addUnit(UnitCategory::Mass, 1e-6, {"mg", "milligram", "milligrams"});
    addUnit(UnitCategory::Mass, 0.001, {"g", "gram", "grams"});
    addUnit(UnitCategory::Mass, 1.0, {"kg", "kilogram", "kilograms"});
    addUnit(UnitCategory::Mass, 1000.0, {"t", "ton", "tons", "tonne", "tonnes"});
    addUnit(UnitCategory::Mass, 0.028349523125, {"oz", "ounce", "ounces"});
    addUnit(UnitCategory::Mass, 0.45359237, {"lb", "lbs", "pound", "pounds"});

    // Время, база — секунда
    addUnit(UnitCategory::Time, 0.001, {"ms", "millisecond", "milliseconds"});
    addUnit(UnitCategory::Time, 1.0, {"s", "sec", "second", "seconds"});
    addUnit(UnitCategory::Time, 60.0, {"min", "minute", "minutes"});
    addUnit(UnitCategory::Time, 3600.0, {"h", "hr", "hour", "hours"});
    addUnit(UnitCategory::Time, 86400.0, {"day", "days"});
    addUnit(UnitCategory::Time, 604800.0, {"week", "weeks"});

    // Объём, база — литр
    addUnit(UnitCategory::Volume, 0.001, {"ml", "milliliter", "milliliters", "millilitre", "millilitres"});
    addUnit(UnitCategory::Volume, 1.0, {"l", "liter", "liters", "litre", "litres"});
    addUnit(UnitCategory::Volume, 3.785411784, {"gal", "gallon", "gallons"});

    // Данные, база — байт
    addUnit(UnitCategory::Data, 1.0, {"b", "byte", "bytes"});
    addUnit(UnitCategory::Data, 1024.0, {"kb", "kilobyte", "kilobytes"});
    addUnit(UnitCategory::Data, 1024.0 * 1024.0, {"mb", "megabyte", "megabytes"});
    addUnit(UnitCategory::Data, 1024.0 * 1024.0 * 1024.0, {"gb", "gigabyte", "gigabytes"});
    addUnit(UnitCategory::Data, 1024.0 * 1024.0 * 1024.0 * 1024.0, {"tb", "terabyte", "terabytes"});

    addUnit(UnitCategory::Temperature, kCelsius, {"c", "celsius"});
    addUnit(UnitCategory::Temperature, kFahrenheit, {"f", "fahrenheit"});
    addUnit(UnitCategory::Temperature, kKelvin, {"k", "kelvin"});
}

void UnitHandler::addUnit(UnitCategory category, double factor,
                          std::initializer_list<const char*> names) {
    for (const char* unitName : names) {
        units[unitName] = {category, factor};
    }
}

std::optional<UnitHandler::UnitDefinition> UnitHandler::find(const std::string& unit) const {
    auto it = units.find(unit);
    if (it == units.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> UnitHandler::convert(double amount, const std::string& from,
                                           const std::string& to) const {
    auto source = find(from);
    auto target = find(to);
    if (!source || !target || source->category != target->category) {
        return std::nullopt;
    }

    if (source->category == UnitCategory::Temperature) {
        return fromCelsius(toCelsius(amount, source->factor), target->factor);
    }
    return amount * source->factor / target->factor;
}

std::optional<std::string> UnitHandler::attempt(const std::string& line) const {
    auto query = parseConversionQuery(line);
    if (!query) {
        return std::nullopt;
    }

    auto converted = convert(query->amount, query->from, query->to);
    if (!converted || !isValidResult(*converted)) {
        return std::nullopt;
    }
    return formatNumber(roundSignificant(*converted, kSignificantDigits));
}

} // namespace linecalc
