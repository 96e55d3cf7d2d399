#include "file_utils.hpp"

#include "conversion_query.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace linecalc {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<std::string> lines;
    std::string buffer;
    while (std::getline(input, buffer)) {
        // Файлы из Windows
        if (!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        lines.push_back(std::move(buffer));
    }
    return lines;
}

CurrencyRates loadCurrencyRates(const std::filesystem::path& path) {
    CurrencyRates rates;
    const auto lines = readLines(path);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto parts = splitWhitespace(line);
        std::optional<double> rate;
        if (parts.size() == 2) {
            rate = parseAmount(parts[1]);
        }
        if (!rate || *rate <= 0.0) {
            throw std::runtime_error("Некорректная строка " + std::to_string(i + 1) +
                                     " в файле курсов: " + path.string());
        }
        rates[parts[0]] = *rate;
    }
    return rates;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace linecalc
