#include "symalg/thread_pool.hpp"

namespace symalg {

ThreadPool::ThreadPool(std::size_t threadCount) {
    const std::size_t count = threadCount > 0 ? threadCount : 1;
    workers.reserve(count);
    while (workers.size() < count) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

// Оставшиеся в очереди задачи выполняются до выхода потоков
ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> guard(mutex);
        stop = true;
    }
    taskAvailable.notify_all();
    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this]() { return tasks.empty() && running == 0; });
}

bool ThreadPool::takeTask(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(mutex);
    taskAvailable.wait(lock, [this]() { return stop || !tasks.empty(); });
    if (tasks.empty()) {
        return false; // stop выставлен и очередь пуста
    }
    task = std::move(tasks.front());
    tasks.pop();
    ++running;
    return true;
}

void ThreadPool::finishTask() {
    std::lock_guard<std::mutex> guard(mutex);
    if (--running == 0 && tasks.empty()) {
        idle.notify_all();
    }
}

void ThreadPool::workerLoop() {
    std::function<void()> task;
    while (takeTask(task)) {
        // packaged_task сам перехватывает исключения задачи
        task();
        task = nullptr;
        finishTask();
    }
}

} // namespace symalg
