#include "user_input.hpp"

#include <stdexcept>
#include <thread>

namespace linecalc {

std::size_t parseNumber(const std::string& value) {
    std::size_t result = 0;
    try {
        std::size_t consumed = 0;
        result = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::size_t defaultThreadCount() {
    std::size_t threads = std::thread::hardware_concurrency();
    return threads == 0 ? 2 : threads; // Резервное значение
}

CliOptions parseArguments(const std::vector<std::string>& arguments) {
    CliOptions options;
    bool modeChosen = false;

    auto chooseMode = [&](RunMode mode) {
        if (modeChosen && options.mode != mode) {
            throw std::runtime_error("Ключи -e, -f и -i нельзя использовать вместе");
        }
        options.mode = mode;
        modeChosen = true;
    };

    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        auto requireValue = [&]() -> const std::string& {
            if (i + 1 >= arguments.size()) {
                throw std::runtime_error("Ключ " + arg + " требует значения");
            }
            return arguments[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.mode = RunMode::Help;
            return options;
        }
        if (arg == "-e" || arg == "--expression") {
            chooseMode(RunMode::Expression);
            options.expression = requireValue();
        } else if (arg == "-f" || arg == "--file") {
            chooseMode(RunMode::Files);
            options.files.emplace_back(requireValue());
            // Все следующие аргументы без '-' — тоже файлы
            while (i + 1 < arguments.size() && !arguments[i + 1].empty() &&
                   arguments[i + 1].front() != '-') {
                options.files.emplace_back(arguments[++i]);
            }
        } else if (arg == "-i" || arg == "--interactive") {
            chooseMode(RunMode::Interactive);
        } else if (arg == "-o" || arg == "--output") {
            options.outputPath = requireValue();
        } else if (arg == "-c" || arg == "--csv") {
            options.csvBesideInput = true;
        } else if (arg == "-t" || arg == "--threads") {
            options.threadCount = parseNumber(requireValue());
        } else if (arg == "-r" || arg == "--rates") {
            options.ratesPath = requireValue();
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            throw std::runtime_error("Неизвестный аргумент: " + arg);
        }
    }

    if (options.outputPath && (options.mode != RunMode::Files || options.files.size() != 1)) {
        throw std::runtime_error("Ключ -o допустим только вместе с одним файлом -f");
    }
    if (options.threadCount == 0) {
        options.threadCount = defaultThreadCount();
    }
    return options;
}

std::string usageText(const std::string& programName) {
    return "Использование: " + programName + " [ключи]\n"
           "  -e, --expression <текст>  вычислить одну строку\n"
           "  -f, --file <файл>...      обработать файлы (каждый — отдельный пакет)\n"
           "  -i, --interactive         интерактивный режим (по умолчанию)\n"
           "  -o, --output <файл.csv>   записать результаты одного файла в CSV\n"
           "  -c, --csv                 CSV рядом с каждым входным файлом\n"
           "  -t, --threads <n>         число потоков для файлов\n"
           "  -r, --rates <файл>        курсы валют: \"КОД КУРС\" в строке\n"
           "  -v, --verbose             печатать сбои обработчиков\n"
           "  -h, --help                эта справка\n";
}

} // namespace linecalc
