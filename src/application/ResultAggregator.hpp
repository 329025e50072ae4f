/**
 * @file ResultAggregator.hpp
 * @brief Single background thread that performs every result store append.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include "domain/ResultEntry.hpp"
#include "infrastructure/ResultStore.hpp"

namespace tidyfile::application {

/**
 * @class ResultAggregator
 * @brief Funnels outcome records from the workers into the ResultStore sequentially.
 *
 * Workers never touch the store; they enqueue and move on.
 */
class ResultAggregator {
public:
    explicit ResultAggregator(std::shared_ptr<infrastructure::ResultStore> store);
    ~ResultAggregator();

    void submit(domain::ResultEntry entry);

    /** @brief Stops the worker thread after every queued record has been written. */
    void stop();

    int appended() const { return m_appended.load(); }
    int duplicates() const { return m_duplicates.load(); }
    int failed() const { return m_failed.load(); }

private:
    void workerLoop();

    std::shared_ptr<infrastructure::ResultStore> m_store;
    std::queue<domain::ResultEntry> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    bool m_running = true;

    std::atomic<int> m_appended{0};
    std::atomic<int> m_duplicates{0};
    std::atomic<int> m_failed{0};
};

} // namespace tidyfile::application
