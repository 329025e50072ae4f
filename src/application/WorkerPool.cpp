#include "application/WorkerPool.hpp"
#include <algorithm>

namespace tidyfile::application {

WorkerPool::WorkerPool(std::size_t threadCount) {
    threadCount = std::max<std::size_t>(1, threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_jobAvailable.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.push(std::move(job));
    }
    m_jobAvailable.notify_one();
}

void WorkerPool::join() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_jobs.empty() && m_activeJobs == 0; });
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_jobAvailable.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
            if (m_stopping && m_jobs.empty()) {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
            ++m_activeJobs;
        }

        job();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_activeJobs;
            if (m_jobs.empty() && m_activeJobs == 0) {
                m_idle.notify_all();
            }
        }
    }
}

} // namespace tidyfile::application
