#include "console.hpp"

#include <iomanip>

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Строчный калькулятор linecalc v1.0                     ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
              << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

void printRecord(const linecalc::CalculationRecord& record, bool verbose) {
    if (verbose) {
        for (const auto& fault : record.faults) {
            std::cerr << Color::YELLOW << "  строка " << record.lineNumber << ", сбой "
                      << fault << Color::RESET << "\n";
        }
    }
    if (!record.result) {
        return;
    }
    std::cout << std::left << std::setw(30) << record.input << " = "
              << Color::GREEN << *record.result << Color::RESET;
    if (verbose) {
        std::cout << Color::GRAY << "  [" << record.handler << "]" << Color::RESET;
    }
    std::cout << "\n";
}
