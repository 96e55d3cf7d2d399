#include "thread_pool.hpp"

namespace linecalc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    // Пул без потоков никогда не выполнит задание
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

// Новые задания больше не принимаются, но очередь дорабатывается до конца:
// future пакетов, поставленных до остановки, обязательно будут готовы
ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// Блокирует поток до появления задания.
// Пусто означает, что пул остановлен и очередь исчерпана.
std::optional<std::function<void()>> ThreadPool::nextTask() {
    std::unique_lock<std::mutex> lock(mutex);
    condition.wait(lock, [this]() { return stopping || !tasks.empty(); });
    if (tasks.empty()) {
        return std::nullopt;
    }

    std::function<void()> task = std::move(tasks.front());
    tasks.pop();
    return task;
}

// Задание выполняется вне блокировки, исключения packaged_task
// сам складывает в future, поэтому поток не падает
void ThreadPool::workerLoop() {
    while (auto task = nextTask()) {
        (*task)();
    }
}

} // namespace linecalc
