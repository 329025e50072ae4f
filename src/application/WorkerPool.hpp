/**
 * @file WorkerPool.hpp
 * @brief Fixed-size thread pool pulling jobs from a shared queue.
 */

#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tidyfile::application {

/**
 * @class WorkerPool
 * @brief Bounded set of worker threads; jobs run in submission order per worker.
 *
 * Jobs must not throw. The destructor drains the queue before joining.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> job);

    /** @brief Blocks until the queue is empty and no job is running. */
    void join();

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_jobAvailable;
    std::condition_variable m_idle;
    std::size_t m_activeJobs = 0;
    bool m_stopping = false;
};

} // namespace tidyfile::application
