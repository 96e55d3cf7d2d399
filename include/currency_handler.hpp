#pragma once

#include <map>
#include <optional>
#include <string>

#include "handler.hpp"

namespace linecalc {

// Курсы валют: код в верхнем регистре -> количество единиц валюты за 1 USD
using CurrencyRates = std::map<std::string, double>;

// Перевод валют по заранее известной таблице курсов: "100 usd to eur".
// Получение свежих курсов по сети — забота вызывающей стороны;
// без таблицы обработчик ничего не принимает.
class CurrencyHandler final : public Handler {
public:
    explicit CurrencyHandler(CurrencyRates rates);

    std::string name() const override { return "currency"; }
    std::optional<std::string> attempt(const std::string& line) const override;

    bool empty() const { return rates.empty(); }

private:
    CurrencyRates rates;

    std::optional<double> rateOf(const std::string& code) const;
};

} // namespace linecalc
