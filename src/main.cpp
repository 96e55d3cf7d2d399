#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "calculator.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "text_utils.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

namespace {

    // Итог обработки одного файла
    struct FileReport {
        std::filesystem::path inputPath;
        std::vector<linecalc::CalculationRecord> records;
        std::optional<std::filesystem::path> csvPath;
    };

    linecalc::CurrencyRates loadRates(const linecalc::CliOptions& options) {
        if (!options.ratesPath) {
            return {};
        }
        return linecalc::loadCurrencyRates(*options.ratesPath);
    }

    // Один файл — один пакет со своим набором переменных
    FileReport processFile(const std::filesystem::path& inputPath,
                           const linecalc::CurrencyRates& rates,
                           const linecalc::CliOptions& options) {
        FileReport report;
        report.inputPath = inputPath;

        linecalc::Calculator calculator(linecalc::makeDefaultHandlers(rates));
        report.records = calculator.calculateDetailed(linecalc::readLines(inputPath));

        if (options.outputPath) {
            report.csvPath = *options.outputPath;
        } else if (options.csvBesideInput) {
            report.csvPath = inputPath.parent_path() /
                (inputPath.stem().string() + "_results_" + linecalc::getCurrentTimeString() + ".csv");
        }
        if (report.csvPath) {
            linecalc::CsvWriter writer(*report.csvPath);
            writer.write(report.records);
        }
        return report;
    }

    int runExpression(const linecalc::CliOptions& options) {
        linecalc::Calculator calculator(linecalc::makeDefaultHandlers(loadRates(options)));
        auto records = calculator.calculateDetailed({options.expression});
        const auto& record = records.front();

        printRecord(record, options.verbose);
        if (!record.result) {
            printError("Не удалось обработать выражение: " + options.expression);
            return 1;
        }
        return 0;
    }

    int runFiles(const linecalc::CliOptions& options) {
        const linecalc::CurrencyRates rates = loadRates(options);

        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Файлов:  " << Color::CYAN << options.files.size() << Color::RESET << "\n";
        std::cout << "  Потоков: " << Color::CYAN << options.threadCount << Color::RESET << "\n\n";

        auto start = std::chrono::steady_clock::now();

        std::vector<std::future<FileReport>> futures;
        {
            linecalc::ThreadPool pool(options.threadCount);
            for (const auto& path : options.files) {
                futures.push_back(pool.submit([path, &rates, &options]() {
                    return processFile(path, rates, options);
                }));
            }
        }

        std::size_t total = 0;
        std::size_t answered = 0;
        int exitCode = 0;

        // Вывод в порядке файлов в командной строке
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                FileReport report = futures[i].get();
                std::cout << Color::BOLD << "== " << report.inputPath.string() << Color::RESET << "\n";
                for (const auto& record : report.records) {
                    printRecord(record, options.verbose);
                    if (!linecalc::trim(record.input).empty()) {
                        ++total;
                        if (record.result) {
                            ++answered;
                        }
                    }
                }
                if (report.csvPath) {
                    std::cout << Color::GREEN << "Результаты сохранены в: " << report.csvPath->string()
                              << Color::RESET << "\n";
                }
                std::cout << "\n";
            }
            catch (const std::exception& ex) {
                printError(options.files[i].string() + ": " + ex.what());
                exitCode = 1;
            }
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
        std::cout << "  Всего строк:      " << Color::CYAN << total << Color::RESET << "\n";
        std::cout << "  С результатом:    " << Color::GREEN << answered << Color::RESET << "\n";
        if (total > answered) {
            std::cout << "  Без результата:   " << Color::YELLOW << (total - answered) << Color::RESET << "\n";
        }
        std::cout << "  Время обработки:  " << duration.count() << " мс\n\n";
        return exitCode;
    }

    int runInteractive(const linecalc::CliOptions& options) {
        printHeader();
        std::cout << "Примеры:\n"
                  << "  2 + 2\n"
                  << "  x = 5\n"
                  << "  x times 3\n"
                  << "  1 km to m\n"
                  << "Команды: " << Color::CYAN << "reset" << Color::RESET << " — забыть переменные, "
                  << Color::CYAN << "exit" << Color::RESET << " — выход\n\n";

        linecalc::Calculator calculator(linecalc::makeDefaultHandlers(loadRates(options)));

        std::string input;
        while (true) {
            std::cout << Color::BOLD << ">>> " << Color::RESET << std::flush;
            if (!std::getline(std::cin, input)) {
                std::cout << "\n";
                break;
            }

            const std::string command = linecalc::trim(input);
            if (command.empty()) {
                continue;
            }
            if (command == "exit" || command == "quit") {
                break;
            }
            if (command == "reset") {
                calculator.resetVariables();
                std::cout << Color::GRAY << "Переменные очищены" << Color::RESET << "\n";
                continue;
            }

            auto records = calculator.calculateDetailed({input});
            const auto& record = records.front();
            if (options.verbose) {
                for (const auto& fault : record.faults) {
                    std::cerr << Color::YELLOW << "  сбой " << fault << Color::RESET << "\n";
                }
            }
            if (record.result) {
                std::cout << Color::GREEN << *record.result << Color::RESET << "\n";
            } else {
                std::cout << Color::YELLOW << "Не удалось обработать выражение" << Color::RESET << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
        return 0;
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    const std::string programName = argc > 0 ? argv[0] : "linecalc";
    try {
        std::vector<std::string> arguments;
        for (int i = 1; i < argc; ++i) {
            arguments.emplace_back(argv[i]);
        }
        linecalc::CliOptions options = linecalc::parseArguments(arguments);

        switch (options.mode) {
        case linecalc::RunMode::Help:
            std::cout << linecalc::usageText(programName);
            return 0;
        case linecalc::RunMode::Expression:
            return runExpression(options);
        case linecalc::RunMode::Files:
            return runFiles(options);
        case linecalc::RunMode::Interactive:
            return runInteractive(options);
        }
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        std::cerr << linecalc::usageText(programName);
        return 1;
    }
    return 0;
}
