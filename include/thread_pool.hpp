#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace linecalc {

// Пул потоков для независимых пакетов строк (например, нескольких файлов).
// Строки внутри одного пакета всегда обрабатываются в одном задании,
// последовательно: они зависят от переменных, определённых выше.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задание в очередь. Исключение задания попадает в future.
    template <class Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    // Число рабочих потоков (не меньше одного)
    std::size_t threadCount() const { return workers.size(); }

private:
    std::vector<std::thread> workers;         // Рабочие потоки
    std::queue<std::function<void()>> tasks;  // Очередь заданий, FIFO

    std::mutex mutex;                         // Защищает tasks и stopping
    std::condition_variable condition;        // Сигнал о новом задании или остановке
    bool stopping = false;                    // Выставляется только в деструкторе

    std::optional<std::function<void()>> nextTask();
    void workerLoop();
};

template <class Func>
inline auto ThreadPool::submit(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // std::function требует копируемости, поэтому packaged_task живёт в shared_ptr
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));
    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return result;
}

} // namespace linecalc
