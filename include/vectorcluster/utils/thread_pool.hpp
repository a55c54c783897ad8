#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <future>
#include <memory>
#include <condition_variable>
#include <mutex>
#include <string>

namespace VectorCluster {

class ThreadPool {
public:
    ThreadPool(size_t numThreads, std::string name = "pool");
    ~ThreadPool();

    // Submit a task to the thread pool
    // Throws std::runtime_error after shutdown()
    void submit(std::function<void()> task);

    // Submit a task whose result (or exception) is delivered through a future
    template <typename F>
    auto submitWithResult(F&& fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        submit([task]() { (*task)(); });
        return result;
    }

    // Get number of pending tasks
    size_t getPendingTasks() const;

    // Stop all threads; queued tasks are still run
    void shutdown();

private:
    void workerLoop();

    std::string name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

}  // namespace VectorCluster
