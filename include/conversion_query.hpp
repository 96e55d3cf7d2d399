#pragma once

#include <optional>
#include <string>

namespace linecalc {

// Запрос на перевод величины: "<число> <из> to|in <в>"
struct ConversionQuery {
    double amount;
    std::string from; // В нижнем регистре
    std::string to;   // В нижнем регистре
};

// Разбор запроса. Ключевое слово to/in и единицы — без учёта регистра.
std::optional<ConversionQuery> parseConversionQuery(const std::string& line);

// Число целиком, без хвоста: "12", "-3.5", "1e3"
std::optional<double> parseAmount(const std::string& text);

// Округление до заданного числа значащих цифр, убирает шум вида 29.999999999999996
double roundSignificant(double value, int digits);

} // namespace linecalc
