#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace symalg {

// Пул потоков для пакетной обработки строк.
// Задачи независимы: каждая разбирает и обрабатывает своё дерево,
// деревья между задачами не передаются.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь и возвращает future с её результатом.
    // Исключение задачи передаётся через future.
    template <class Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    // Блокирует вызывающий поток, пока очередь не опустеет
    // и все запущенные задачи не завершатся
    void waitIdle();

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;
    std::condition_variable taskAvailable;
    std::condition_variable idle;
    std::size_t running = 0; // Задачи, выполняющиеся прямо сейчас
    bool stop = false;

    void workerLoop();

    // Ждёт задачу; false, если пул остановлен и очередь пуста
    bool takeTask(std::function<void()>& task);
    void finishTask();
};

template <class Func>
auto ThreadPool::enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // std::function требует копируемости, поэтому packaged_task живёт в shared_ptr
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));
    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }
    taskAvailable.notify_one();
    return result;
}

} // namespace symalg
