#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace grapher {

// Пул потоков для построения графиков в фоне.
// Ядро вычислений однопоточное; параллельность живёт только здесь,
// в приложении: одна задача = одна функция, скомпилированная и посчитанная целиком.
class ThreadPool {
public:
    // При threadCount == 0 запускается один поток
    explicit ThreadPool(std::size_t threadCount);

    // Дожидается выполнения всех поставленных задач и останавливает потоки
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавляет задачу в очередь.
    // Исключение из задачи попадает в future и бросается при get().
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;        // Рабочие потоки
    std::queue<std::function<void()>> tasks; // Очередь задач

    std::mutex mutex;                  // Защищает очередь и флаг остановки
    std::condition_variable condition; // Будит потоки при появлении задач
    bool stop = false;

    // Ждёт задачу; false означает остановку пула при пустой очереди
    bool takeTask(std::function<void()>& task);

    void workerLoop();
};

template <class Func, class... Args>
inline auto ThreadPool::enqueue(Func&& func, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>> {
    using Return = std::invoke_result_t<Func, Args...>;

    // packaged_task хранит результат или исключение для future
    auto task = std::make_shared<std::packaged_task<Return()>>(
        [func = std::forward<Func>(func),
         arguments = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Return {
            return std::apply(func, std::move(arguments));
        });

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}

} // namespace grapher
