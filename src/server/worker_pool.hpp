#ifndef MEDIASHUTTLE_SRC_SERVER_WORKER_POOL_HPP_
#define MEDIASHUTTLE_SRC_SERVER_WORKER_POOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace MediaShuttle::Server
{

// Fixed-size pool of threads draining a FIFO task queue. Used to run one
// connection per task; tasks may block for as long as their transfer lasts.
class WorkerPool
{
    public:
    explicit WorkerPool(std::size_t num_threads = std::thread::hardware_concurrency());
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error once Shutdown() has begun.
    void SubmitTask(std::function<void()>&& task);

    // Stops accepting tasks, drains the queue and joins the workers. Idempotent.
    void Shutdown();

    std::size_t GetThreadCount() const { return workers_.size(); }

    private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

}  // namespace MediaShuttle::Server

#endif  // MEDIASHUTTLE_SRC_SERVER_WORKER_POOL_HPP_
