#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "currency_handler.hpp"
#include "evaluator.hpp"
#include "handler.hpp"
#include "pipeline.hpp"
#include "preprocessor.hpp"
#include "thread_pool.hpp"
#include "variable_store.hpp"

namespace linecalc {

// Результат обработки одной строки пакета
struct CalculationRecord {
    std::size_t lineNumber = 0;        // Номер строки, с 1
    std::string input;                 // Исходный текст
    std::string processed;             // Текст после препроцессора
    bool definition = false;           // Строка была присваиванием
    std::string handler;               // Ответивший обработчик, пусто если никто
    std::optional<std::string> result;
    std::vector<std::string> faults;
};

// Обработчики в порядке по умолчанию: math, unit, currency, variable
std::vector<std::unique_ptr<Handler>> makeDefaultHandlers(CurrencyRates rates = {},
                                                          EvaluatorLimits limits = {});

// Пакет как свёртка по строкам: хранилище переменных — накапливаемое состояние,
// поэтому строки обрабатываются строго по порядку.
std::vector<CalculationRecord> calculateBatch(Preprocessor& preprocessor,
                                              const DispatchPipeline& pipeline,
                                              const std::vector<std::string>& lines);

// Калькулятор строк: препроцессор + конвейер обработчиков + хранилище переменных.
// Переменные живут между вызовами calculate до resetVariables.
// Пакеты одного экземпляра выполняются по очереди, строки разных пакетов
// не перемешиваются. Для параллельной обработки нужны отдельные экземпляры
// (main.cpp заводит свой Calculator на каждый файл).
class Calculator {
public:
    Calculator();
    explicit Calculator(std::vector<std::unique_ptr<Handler>> handlers);

    Calculator(const Calculator&) = delete;
    Calculator& operator=(const Calculator&) = delete;

    // Один результат на каждую входную строку, в том же порядке
    std::vector<std::optional<std::string>> calculate(const std::vector<std::string>& lines);

    std::vector<CalculationRecord> calculateDetailed(const std::vector<std::string>& lines);

    // Пакет целиком выполняется одним заданием пула.
    // Калькулятор должен жить, пока future не готов.
    // Два пакета на одном экземпляре не идут параллельно, а ждут друг друга.
    std::future<std::vector<std::optional<std::string>>> calculateAsync(
        ThreadPool& pool, std::vector<std::string> lines);

    void resetVariables();

    VariableStore& variables() { return store; }
    const DispatchPipeline& handlers() const { return pipeline; }

private:
    VariableStore store;
    Preprocessor preprocessor;
    DispatchPipeline pipeline;

    std::mutex batchMutex; // Один пакет за раз
};

} // namespace linecalc
