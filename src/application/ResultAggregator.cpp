/**
 * @file ResultAggregator.cpp
 * @brief Implementation of ResultAggregator.
 */

#include "application/ResultAggregator.hpp"
#include <iostream>

namespace tidyfile::application {

ResultAggregator::ResultAggregator(std::shared_ptr<infrastructure::ResultStore> store) : m_store(std::move(store)) {
    m_worker = std::thread(&ResultAggregator::workerLoop, this);
}

ResultAggregator::~ResultAggregator() {
    stop();
}

void ResultAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void ResultAggregator::submit(domain::ResultEntry entry) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(std::move(entry));
    }
    m_cv.notify_one();
}

void ResultAggregator::workerLoop() {
    while (true) {
        domain::ResultEntry entry;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });

            if (!m_running && m_queue.empty()) {
                return;
            }

            entry = std::move(m_queue.front());
            m_queue.pop();
        }

        // Store I/O happens outside the queue lock.
        auto status = m_store->append(entry);
        switch (status) {
            case infrastructure::AppendStatus::Appended:
                ++m_appended;
                break;
            case infrastructure::AppendStatus::Duplicate:
                ++m_duplicates;
                break;
            case infrastructure::AppendStatus::Corrupted:
            case infrastructure::AppendStatus::IoFailure:
                ++m_failed;
                std::cerr << "[ResultAggregator] Could not record " << entry.fileName << ": "
                          << infrastructure::AppendStatusToString(status) << std::endl;
                break;
        }
    }
}

} // namespace tidyfile::application
