#include "currency_handler.hpp"

#include "conversion_query.hpp"
#include "evaluator.hpp"

#include <cctype>
#include <cmath>

namespace linecalc {

namespace {
std::string toUpper(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return text;
}
}

CurrencyHandler::CurrencyHandler(CurrencyRates sourceRates) {
    // Нормализуем коды и отбрасываем бессмысленные курсы
    for (const auto& [code, rate] : sourceRates) {
        if (std::isfinite(rate) && rate > 0.0) {
            rates[toUpper(code)] = rate;
        }
    }
    // Базовая валюта таблицы всегда известна
    if (!rates.empty()) {
        rates.emplace("USD", 1.0);
    }
}

std::optional<double> CurrencyHandler::rateOf(const std::string& code) const {
    auto it = rates.find(toUpper(code));
    if (it == rates.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CurrencyHandler::attempt(const std::string& line) const {
    if (rates.empty()) {
        return std::nullopt;
    }

    auto query = parseConversionQuery(line);
    if (!query) {
        return std::nullopt;
    }

    auto fromRate = rateOf(query->from);
    auto toRate = rateOf(query->to);
    if (!fromRate || !toRate) {
        return std::nullopt;
    }

    // Денежные суммы округляем до сотых
    double converted = std::round(query->amount / *fromRate * *toRate * 100.0) / 100.0;
    if (!isValidResult(converted)) {
        return std::nullopt;
    }
    return formatNumber(converted);
}

} // namespace linecalc
