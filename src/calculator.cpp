#include "calculator.hpp"

#include "math_handler.hpp"
#include "unit_handler.hpp"
#include "variable_handler.hpp"

namespace linecalc {

// Порядок важен: арифметика проверяется первой,
// переменная последней, как самый общий случай
std::vector<std::unique_ptr<Handler>> makeDefaultHandlers(CurrencyRates rates,
                                                          EvaluatorLimits limits) {
    std::vector<std::unique_ptr<Handler>> handlers;
    handlers.push_back(std::make_unique<MathHandler>(limits));
    handlers.push_back(std::make_unique<UnitHandler>());
    handlers.push_back(std::make_unique<CurrencyHandler>(std::move(rates)));
    handlers.push_back(std::make_unique<VariableHandler>(limits));
    return handlers;
}

std::vector<CalculationRecord> calculateBatch(Preprocessor& preprocessor,
                                              const DispatchPipeline& pipeline,
                                              const std::vector<std::string>& lines) {
    std::vector<CalculationRecord> records;
    records.reserve(lines.size());

    // Строки строго по порядку: каждая видит определения предыдущих
    for (std::size_t i = 0; i < lines.size(); ++i) {
        CalculationRecord record;
        record.lineNumber = i + 1;
        record.input = lines[i];

        ProcessedLine processed = preprocessor.process(lines[i]);
        record.processed = processed.text;
        record.definition = processed.isDefinition;

        // Обработчикам отдаём уже подставленный текст
        DispatchOutcome outcome = pipeline.dispatch(processed.text);
        record.result = std::move(outcome.result);
        record.handler = std::move(outcome.handlerName);
        record.faults = std::move(outcome.faults);

        records.push_back(std::move(record));
    }
    return records;
}

Calculator::Calculator() : Calculator(makeDefaultHandlers()) {}

// Препроцессор ссылается на store, поэтому store объявлен в классе раньше
Calculator::Calculator(std::vector<std::unique_ptr<Handler>> handlers)
    : preprocessor(store), pipeline(std::move(handlers)) {}

std::vector<std::optional<std::string>> Calculator::calculate(const std::vector<std::string>& lines) {
    std::vector<std::optional<std::string>> results;
    results.reserve(lines.size());

    // Оставляем от записей только результаты
    for (auto& record : calculateDetailed(lines)) {
        results.push_back(std::move(record.result));
    }
    return results;
}

std::vector<CalculationRecord> Calculator::calculateDetailed(const std::vector<std::string>& lines) {
    // Хранилище общее для всех пакетов, поэтому пакет держит его целиком
    std::lock_guard<std::mutex> lock(batchMutex);
    return calculateBatch(preprocessor, pipeline, lines);
}

std::future<std::vector<std::optional<std::string>>> Calculator::calculateAsync(
    ThreadPool& pool, std::vector<std::string> lines) {
    // Строки копируются в задание: вызывающий может освободить свой вектор сразу
    return pool.submit([this, batch = std::move(lines)]() { return calculate(batch); });
}

void Calculator::resetVariables() {
    std::lock_guard<std::mutex> lock(batchMutex);
    store.resetUserVariables();
}

} // namespace linecalc
