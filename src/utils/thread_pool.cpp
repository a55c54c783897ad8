#include <vectorcluster/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace VectorCluster {

ThreadPool::ThreadPool(size_t numThreads, std::string name)
    : name(std::move(name)), isRunning(true) {
    if (numThreads == 0) {
        numThreads = 1;
    }
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::debug("[ThreadPool:{}] Started {} workers", this->name, numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load()) {
            throw std::runtime_error("ThreadPool " + name + " is shut down");
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

size_t ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return tasks.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.exchange(false)) {
            return;
        }
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    spdlog::debug("[ThreadPool:{}] Stopped", name);
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this] { return !isRunning.load() || !tasks.empty(); });
            if (tasks.empty()) {
                return;     // Stopped and drained
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool:{}] Task failed: {}", name, e.what());
        }
    }
}

}  // namespace VectorCluster
