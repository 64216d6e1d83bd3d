#include "thread_pool.hpp"

namespace grapher {

ThreadPool::ThreadPool(std::size_t threadCount) {
    std::size_t count = threadCount == 0 ? 1 : threadCount;
    workers.reserve(count);
    while (workers.size() < count) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }
    // Очередь функций дорабатывается до конца: в CSV не должно быть пропусков
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::takeTask(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(mutex);
    condition.wait(lock, [this]() { return stop || !tasks.empty(); });
    if (tasks.empty()) {
        return false;
    }
    task = std::move(tasks.front());
    tasks.pop();
    return true;
}

void ThreadPool::workerLoop() {
    std::function<void()> task;
    while (takeTask(task)) {
        // Построение графика идёт без блокировки очереди
        task();
        task = nullptr;
    }
}

} // namespace grapher
