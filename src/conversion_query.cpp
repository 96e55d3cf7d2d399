#include "conversion_query.hpp"

#include "text_utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace linecalc {

std::optional<ConversionQuery> parseConversionQuery(const std::string& line) {
    auto parts = splitWhitespace(line);
    if (parts.size() != 4) {
        return std::nullopt;
    }

    const std::string keyword = toLower(parts[2]);
    if (keyword != "to" && keyword != "in") {
        return std::nullopt;
    }

    auto amount = parseAmount(parts[0]);
    if (!amount) {
        return std::nullopt;
    }
    return ConversionQuery{*amount, toLower(parts[1]), toLower(parts[3])};
}

std::optional<double> parseAmount(const std::string& text) {
    double value = 0.0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

double roundSignificant(double value, int digits) {
    if (value == 0.0 || !std::isfinite(value)) {
        return value;
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*g", digits, value);
    return std::strtod(buffer, nullptr);
}

} // namespace linecalc
