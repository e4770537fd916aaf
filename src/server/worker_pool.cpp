#include "server/worker_pool.hpp"

#include <spdlog/spdlog.h>
#include <exception>
#include <stdexcept>

namespace MediaShuttle::Server
{

WorkerPool::WorkerPool(std::size_t num_threads)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            this->WorkerThread();
        });
    }
    spdlog::debug("Worker pool started with {} thread(s)", num_threads);
}

WorkerPool::~WorkerPool() { Shutdown(); }

void WorkerPool::Shutdown()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerThread()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return this->stop_ || !this->tasks_.empty();
            });
            if (this->stop_ && this->tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task terminated with exception: {}", e.what());
        }
    }
}

void WorkerPool::SubmitTask(std::function<void()>&& task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }
        tasks_.emplace_back(std::move(task));
    }
    condition_.notify_one();
}

}  // namespace MediaShuttle::Server
